// src/rustactions/binds/KeysCfgDefaults.cpp
#include "rustactions/binds/KeysCfgStore.hpp"

namespace rustactions::binds {

const std::vector<std::string>& DefaultUserSection()
{
    static const std::vector<std::string> kDefaults = {
        "bind tab inventory.toggle",
        "bind return chat.open",
        "bind space +jump",
        "bind 1 +slot1",
        "bind 2 +slot2",
        "bind 3 +slot3",
        "bind 4 +slot4",
        "bind 5 +slot5",
        "bind 6 +slot6",
        "bind 7 +holsteritem",
        "bind a +left",
        "bind b +gestures",
        "bind c forward;sprint",
        "bind d +right",
        "bind e +nextskin;+nextskin;+nextskin;+nextskin;+nextskin;+nextskin;+nextskin;+nextskin;+nextskin;+nextskin;+nextskin;+nextskin;+nextskin;+nextskin;+use",
        "bind f +focusmap;lighttoggle",
        "bind g +map",
        "bind h +hoverloot",
        "bind j +global.hudcomponent BinocularOverlay 1;global.hudcomponent BinocularOverlay 0",
        "bind k exec keys.cfg",
        "bind m +firemode",
        "bind n inventory.examineheld",
        "bind p +pets",
        "bind q +prevskin;+prevskin;+prevskin;+prevskin;+prevskin;+prevskin;+prevskin;+prevskin;+prevskin;+prevskin;+prevskin;+prevskin;+prevskin;+prevskin;+ping",
        "bind r +reload",
        "bind s +backward",
        "bind t chat.open",
        "bind v +voice",
        "bind w +forward",
        "bind x swapseats",
        "bind y +opentutorialhelp",
        "bind z attack;duck",
        "bind keypad1 +notec",
        "bind keypad2 +noted",
        "bind keypad3 +notee",
        "bind keypad4 +notef",
        "bind keypad5 +noteg",
        "bind keypad6 +notea",
        "bind keypad7 +noteb",
        "bind keypadplus +notesharpmod",
        "bind keypadenter +noteoctaveupmod",
        "bind pageup +zoomincrease",
        "bind pagedown +zoomdecrease",
        "bind f1 combatlog;consoletoggle",
        "bind leftshift +sprint",
        "bind leftcontrol +duck",
        "bind leftalt +altlook;+meta.if_true \"headlerp 0\";+meta.if_false \"headlerp 100\"",
        "bind mouse0 +attack",
        "bind mouse1 +attack2",
        "bind mouse2 +attack3",
        "bind mouse3 inventory.togglecrafting",
        "bind mouse4 ~graphics.fov 70;graphics.fov 80",
        "bind mousewheelup +invprev",
        "bind mousewheeldown +invnext",
        "bind [leftcontrol+1] swaptoseat 0",
        "bind [leftcontrol+2] swaptoseat 1",
        "bind [leftcontrol+3] swaptoseat 2",
        "bind [leftcontrol+4] swaptoseat 3",
        "bind [leftcontrol+5] swaptoseat 4",
        "bind [leftcontrol+6] swaptoseat 5",
        "bind [leftcontrol+7] swaptoseat 6",
        "bind [leftcontrol+8] swaptoseat 7",
        "bind [leftshift+mousewheelup] +wireslackup",
        "bind [leftshift+mousewheeldown] +wireslackdown",
    };
    return kDefaults;
}

} // namespace rustactions::binds
