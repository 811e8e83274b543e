#pragma once

#include <cstdint>

namespace aria
{

struct Color;
struct ColorScheme;
struct AdaptiveSchemes;
struct Frame;
struct Rect;

struct Track;
struct PlaybackTarget;
struct PlayerQueue;
struct CommandResult;

class PlaybackSource;
class ArtworkService;
class PreferenceStore;

class Timeline;
class FrameScheduler;
class ExpansionController;
class QueuePanelController;
class SwipeSwitchController;
class HintController;
class AdaptivePalette;
class PositionReadout;
class PlayerOverlay;
class PlayerSettings;

struct ScreenMetrics;
struct ExpansionGeometry;
struct MiniContent;
struct PlayerFrame;
struct OverlayConfig;

}   // namespace aria
