#pragma once

#include <aria/color.hpp>
#include <aria/easing.hpp>
#include <aria/frame.hpp>
#include <aria/fwd.hpp>
#include <aria/geometry.hpp>
#include <aria/logger.hpp>
#include <aria/observable.hpp>
#include <aria/playback.hpp>
#include <aria/player_config.hpp>
#include <aria/player_frame.hpp>
#include <aria/player_overlay.hpp>
#include <aria/timeline.hpp>

// ─── Usage ───────────────────────────────────────────────────────────────────
//
//   MySource source;                      // implements aria::PlaybackSource
//   aria::PlayerOverlay player(source, &artwork, &settings);
//   player.set_screen({390, 844, 47, 34});
//
//   // every frame
//   player.tick(dt);
//   draw(player.frame());
//
//   // after any upstream change
//   player.refresh();
