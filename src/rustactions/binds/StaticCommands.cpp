// src/rustactions/binds/StaticCommands.cpp
#include "rustactions/binds/StaticCommands.hpp"

#include <array>

namespace rustactions::binds {

namespace {

constexpr std::array kStaticCommands = {
    StaticCommand{"kill", "kill"},
    StaticCommand{"respawn", "respawn"},
    StaticCommand{"autorun", "forward;sprint;chat.add 0 0 \"Auto run enabled!\""},
    StaticCommand{"autorun_jump", "forward;sprint;jump;chat.add 0 0 \"Auto run and jump enabled!\""},
    StaticCommand{"crouch_attack", "attack;duck;chat.add 0 0 \"Auto crouch and attack enabled!\""},
    StaticCommand{"quit_game", "quit"},
    StaticCommand{"disconnect", "disconnect"},
    StaticCommand{"lookat_radius_20", "client.lookatradius 20;chat.add 0 0 \"Look radius set to wide (20)\""},
    StaticCommand{"lookat_radius_0", "client.lookatradius 0.0002;chat.add 0 0 \"Look radius set to narrow (0.0002)\""},
    StaticCommand{"audio_voices_0", "audio.voices 0;chat.add 0 0 \"Voice volume set to 0%\""},
    StaticCommand{"audio_voices_25", "audio.voices 0.25;chat.add 0 0 \"Voice volume set to 25%\""},
    StaticCommand{"audio_voices_50", "audio.voices 0.5;chat.add 0 0 \"Voice volume set to 50%\""},
    StaticCommand{"audio_voices_75", "audio.voices 0.75;chat.add 0 0 \"Voice volume set to 75%\""},
    StaticCommand{"audio_voices_100", "audio.voices 1;chat.add 0 0 \"Voice volume set to 100%\""},
    StaticCommand{"audio_master_0", "audio.master 0;chat.add 0 0 \"Master volume set to 0%\""},
    StaticCommand{"audio_master_25", "audio.master 0.25;chat.add 0 0 \"Master volume set to 25%\""},
    StaticCommand{"audio_master_50", "audio.master 0.5;chat.add 0 0 \"Master volume set to 50%\""},
    StaticCommand{"audio_master_75", "audio.master 0.75;chat.add 0 0 \"Master volume set to 75%\""},
    StaticCommand{"audio_master_100", "audio.master 1;chat.add 0 0 \"Master volume set to 100%\""},
    StaticCommand{"hud_off", "graphics.hud 0"},
    StaticCommand{"hud_on", "graphics.hud 1"},
    StaticCommand{"gesture_wave", "gesture wave"},
    StaticCommand{"gesture_victory", "gesture victory"},
    StaticCommand{"gesture_shrug", "gesture shrug"},
    StaticCommand{"gesture_thumbsup", "gesture thumbsup"},
    StaticCommand{"gesture_hurry", "gesture hurry"},
    StaticCommand{"gesture_ok", "gesture ok"},
    StaticCommand{"gesture_thumbsdown", "gesture thumbsdown"},
    StaticCommand{"gesture_clap", "gesture clap"},
    StaticCommand{"gesture_point", "gesture point"},
    StaticCommand{"gesture_friendly", "gesture friendly"},
    StaticCommand{"gesture_cabbagepatch", "gesture cabbagepatch"},
    StaticCommand{"gesture_twist", "gesture twist"},
    StaticCommand{"gesture_raisetheroof", "gesture raisetheroof"},
    StaticCommand{"gesture_beatchest", "gesture beatchest"},
    StaticCommand{"gesture_throatcut", "gesture throatcut"},
    StaticCommand{"gesture_fingergun", "gesture fingergun"},
    StaticCommand{"gesture_shush", "gesture shush"},
    StaticCommand{"gesture_shush_vocal", "gesture shush_vocal"},
    StaticCommand{"gesture_watchingyou", "gesture watchingyou"},
    StaticCommand{"gesture_loser", "gesture loser"},
    StaticCommand{"gesture_nono", "gesture nono"},
    StaticCommand{"gesture_knucklescrack", "gesture knucklescrack"},
    StaticCommand{"gesture_rps", "gesture rps"},
    StaticCommand{"noclip_true", "noclip true;chat.add 0 0 \"Noclip enabled!\""},
    StaticCommand{"noclip_false", "noclip false;chat.add 0 0 \"Noclip disabled!\""},
    StaticCommand{"global_god_true", "global.god true;chat.add 0 0 \"God mode enabled!\""},
    StaticCommand{"global_god_false", "global.god false;chat.add 0 0 \"God mode disabled!\""},
    StaticCommand{"env_time_0", "env.time 0;chat.add 0 0 \"Time set to 00:00 (midnight)\""},
    StaticCommand{"env_time_4", "env.time 4;chat.add 0 0 \"Time set to 04:00 (early morning)\""},
    StaticCommand{"env_time_8", "env.time 8;chat.add 0 0 \"Time set to 08:00 (morning)\""},
    StaticCommand{"env_time_12", "env.time 12;chat.add 0 0 \"Time set to 12:00 (noon)\""},
    StaticCommand{"env_time_16", "env.time 16;chat.add 0 0 \"Time set to 16:00 (afternoon)\""},
    StaticCommand{"env_time_20", "env.time 20;chat.add 0 0 \"Time set to 20:00 (evening)\""},
    StaticCommand{"env_time_24", "env.time 24;chat.add 0 0 \"Time set to 24:00 (midnight)\""},
    StaticCommand{"teleport2marker", "teleport2marker;chat.add 0 0 \"Teleported to marker!\""},
    StaticCommand{"combatlog", "combatlog"},
    StaticCommand{"console_clear", "console.clear"},
    StaticCommand{"consoletoggle", "consoletoggle"},
    StaticCommand{"chat_continuous_stack_enabled", "chat.add 0 0 \"Continuous stack inventory enabled!\""},
    StaticCommand{"chat_continuous_stack_disabled", "chat.add 0 0 \"Continuous stack inventory disabled!\""},
    StaticCommand{"chat_anti_afk_started", "chat.add 0 0 \"Anti-AFK started!\""},
    StaticCommand{"chat_anti_afk_stopped", "chat.add 0 0 \"Anti-AFK stopped!\""},
    StaticCommand{"cancel_all_crafting", "craft.cancelall;chat.add 0 0 \"All crafting cancelled!\""},
    StaticCommand{"ent_kill", "ent kill;chat.add 0 0 \"Entity killed!\""},
};

} // namespace

std::span<const StaticCommand> DefaultStaticCommands() noexcept
{
    return kStaticCommands;
}

} // namespace rustactions::binds
