#pragma once

#include <aria/fwd.hpp>
#include <aria/geometry.hpp>
#include <aria/observable.hpp>
#include <aria/playback.hpp>
#include <aria/player_config.hpp>
#include <aria/player_frame.hpp>
#include <aria/timeline.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace aria
{

// Composition root of the persistent player. Owns the expansion, queue
// panel, swipe-switch and hint controllers plus the frame clock, reads
// upstream snapshots from the PlaybackSource, routes input, and produces
// one PlayerFrame per change.
//
// Single-threaded: every method, and every command callback delivered by
// the source, must run on the thread that calls tick().
class PlayerOverlay
{
   public:
    PlayerOverlay(PlaybackSource&  source,
                  ArtworkService*  artwork,
                  PreferenceStore* prefs,
                  OverlayConfig    config = {});
    ~PlayerOverlay();

    PlayerOverlay(const PlayerOverlay&)            = delete;
    PlayerOverlay& operator=(const PlayerOverlay&) = delete;

    // ─── Upstream ───────────────────────────────────────────────────────
    // Re-read the source after any upstream change.
    void refresh();
    void set_connected(bool connected);
    void set_screen(const ScreenMetrics& screen);
    void set_dark_mode(bool dark);
    void set_adaptive_theme(bool enabled);

    // Advance every timeline and timer by dt seconds, then recompose.
    void tick(float dt);

    // ─── Chrome surface ─────────────────────────────────────────────────
    float                expansion_progress() const;
    std::optional<Color> expanded_background_color() const;
    bool                 is_expanded() const;
    void                 expand();
    void                 collapse();

    const ExpansionNotifier& expansion_notifier() const { return notifier_; }
    ExpansionNotifier&       expansion_notifier() { return notifier_; }

    NavBarTint nav_tint();

    // ─── Input ──────────────────────────────────────────────────────────
    // Hit-test against the last frame's gesture regions, topmost first.
    bool tap(float x, float y);

    void horizontal_drag_start(float x, float y);
    void horizontal_drag_update(float dx);
    void horizontal_drag_end(float velocity);

    // Vertical drag delta in px; upward (negative) expands, downward collapses.
    void vertical_drag(float delta);

    // System back. Returns false when there was nothing to close.
    bool back();

    // ─── Direct actions ─────────────────────────────────────────────────
    bool toggle_queue();
    void play_pause();
    void skip_next();
    void skip_previous();
    void stop();
    void toggle_shuffle();
    void cycle_repeat();
    void begin_seek(float seconds);
    void update_seek(float seconds);
    void commit_seek(float seconds);
    void set_volume(int volume);
    void show_target_selector();
    void dismiss_target_selector();
    // Downward pull on the open selector; upward deltas are ignored.
    void selector_drag(float dy);
    // Dismisses past the distance or velocity threshold, springs back otherwise.
    void selector_drag_end(float velocity);
    void select_target(const std::string& target_id);
    void hide_player();
    void show_player();
    void skip_hint();

    // ─── Output ─────────────────────────────────────────────────────────
    const PlayerFrame& frame() const { return frame_; }

    const std::optional<PlaybackTarget>& selected_target() const { return selected_; }
    const std::optional<Track>&          current_track() const { return track_; }
    const std::optional<PlayerQueue>&    queue() const { return queue_; }
    const std::optional<std::string>&    notification() const { return notification_; }
    bool                                 is_target_selector_visible() const { return selector_open_; }
    float                                selector_reveal() const { return selector_.value(); }
    bool                                 is_connected() const { return connected_; }

    const FrameScheduler&        scheduler() const { return *scheduler_; }
    const ExpansionController&   expansion() const { return *expansion_; }
    const QueuePanelController&  queue_panel() const { return *queue_panel_; }
    const SwipeSwitchController& swipe() const { return *swipe_; }
    const HintController&        hints() const { return *hint_; }
    const AdaptivePalette&       palette() const { return *palette_; }
    const PositionReadout&       readout() const { return *readout_; }
    const OverlayConfig&         config() const { return config_; }

   private:
    enum class DragRoute
    {
        None,
        Swipe,
        Fling,
    };

    using DoneCallback = std::function<void(bool ok)>;

    void wire_controllers();
    void compose();
    void build_regions(PlayerFrame& f) const;
    void dispatch(GestureAction action, float x, const Rect& rect);

    void run_command(const std::string&                           name,
                     const std::function<void(CommandCallback)>& issue,
                     DoneCallback                                 on_done = nullptr);
    void command_finished(const std::string& name, const CommandResult& result, const DoneCallback& on_done);
    void notify(const std::string& message);
    void load_queue();
    void request_artwork_colors();
    void start_readout_timer();
    void stop_readout_timer();
    bool is_visible() const;
    bool selector_shown() const;
    void check_selector_bounce();

    PlaybackSource&  source_;
    ArtworkService*  artwork_;
    PreferenceStore* prefs_;
    OverlayConfig    config_;

    // Declared first: controllers cancel their timers on destruction
    std::unique_ptr<FrameScheduler> scheduler_;

    std::unique_ptr<ExpansionController>   expansion_;
    std::unique_ptr<QueuePanelController>  queue_panel_;
    std::unique_ptr<SwipeSwitchController> swipe_;
    std::unique_ptr<HintController>        hint_;
    std::unique_ptr<AdaptivePalette>       palette_;
    std::unique_ptr<PositionReadout>       readout_;
    Timeline                               hide_;
    Timeline                               selector_;

    ExpansionNotifier notifier_;
    ScreenMetrics     screen_;

    bool                          connected_ = false;
    std::optional<PlaybackTarget> selected_;
    std::optional<Track>          track_;
    std::vector<PlaybackTarget>   targets_;
    std::optional<PlayerQueue>    queue_;

    bool                       selector_open_           = false;
    bool                       selector_dragging_       = false;
    bool                       selector_bounce_pending_ = false;
    float                      selector_drag_offset_    = 0.0f;
    std::optional<std::string> notification_;

    uint32_t notification_timer_ = 0;
    uint32_t readout_timer_      = 0;

    DragRoute drag_route_   = DragRoute::None;
    float     drag_start_x_ = 0.0f;

    PlayerFrame frame_;

    // Command callbacks hold a weak reference; late answers after
    // destruction are dropped
    std::shared_ptr<PlayerOverlay*> alive_;
};

}   // namespace aria
