#include <algorithm>
#include <aria/logger.hpp>
#include <aria/player_overlay.hpp>
#include <cmath>
#include <exception>
#include <initializer_list>

#include "anim/frame_scheduler.hpp"
#include "ui/player/adaptive_palette.hpp"
#include "ui/player/expansion_controller.hpp"
#include "ui/player/hint_controller.hpp"
#include "ui/player/mini_content.hpp"
#include "ui/player/player_geometry.hpp"
#include "ui/player/position_readout.hpp"
#include "ui/player/queue_panel_controller.hpp"
#include "ui/player/swipe_switch_controller.hpp"
#include "ui/theme/design_tokens.hpp"

namespace aria
{

namespace tokens = ui::tokens;

const char* gesture_action_name(GestureAction action)
{
    switch (action)
    {
        case GestureAction::Expand:
            return "expand";
        case GestureAction::Collapse:
            return "collapse";
        case GestureAction::PlayPause:
            return "play_pause";
        case GestureAction::SkipNext:
            return "skip_next";
        case GestureAction::SkipPrevious:
            return "skip_previous";
        case GestureAction::ToggleShuffle:
            return "toggle_shuffle";
        case GestureAction::CycleRepeat:
            return "cycle_repeat";
        case GestureAction::ToggleQueue:
            return "toggle_queue";
        case GestureAction::Seek:
            return "seek";
        case GestureAction::Volume:
            return "volume";
        case GestureAction::ShowTargetSelector:
            return "show_target_selector";
        case GestureAction::DismissTargetSelector:
            return "dismiss_target_selector";
        case GestureAction::SkipHint:
            return "skip_hint";
    }
    return "unknown";
}

namespace
{

constexpr float HEADER_BUTTON  = 48.0f;
constexpr float SEEK_BAR_H     = 24.0f;
constexpr float VOLUME_BAR_H   = 32.0f;
constexpr float VOLUME_INSET   = 48.0f;
constexpr float SKIP_BUTTON_W  = 120.0f;
constexpr float SKIP_BUTTON_H  = 40.0f;
constexpr float HIDE_OVERSHOOT = 20.0f;

size_t count_available(const std::vector<PlaybackTarget>& targets)
{
    return static_cast<size_t>(std::count_if(targets.begin(),
                                             targets.end(),
                                             [](const PlaybackTarget& t) { return t.available; }));
}

float rect_fraction(const Rect& r, float x)
{
    if (r.w <= 0.0f)
        return 0.0f;
    return std::clamp((x - r.x) / r.w, 0.0f, 1.0f);
}

}   // namespace

// ─── Construction ───────────────────────────────────────────────────────────

PlayerOverlay::PlayerOverlay(PlaybackSource&  source,
                             ArtworkService*  artwork,
                             PreferenceStore* prefs,
                             OverlayConfig    config)
    : source_(source),
      artwork_(artwork),
      prefs_(prefs),
      config_(std::move(config)),
      scheduler_(std::make_unique<FrameScheduler>()),
      expansion_(std::make_unique<ExpansionController>(config_.expansion_duration)),
      queue_panel_(std::make_unique<QueuePanelController>(*scheduler_, config_.queue)),
      swipe_(std::make_unique<SwipeSwitchController>(source_, config_.swipe)),
      hint_(std::make_unique<HintController>(*scheduler_, prefs_, config_.hint)),
      palette_(std::make_unique<AdaptivePalette>(artwork_, config_.dark_scheme, config_.light_scheme)),
      readout_(std::make_unique<PositionReadout>()),
      hide_(config_.hide_duration, ease::ease_out_cubic, ease::ease_in_cubic),
      selector_(config_.selector.reveal_duration, ease::ease_out_cubic, ease::ease_in_cubic),
      alive_(std::make_shared<PlayerOverlay*>(this))
{
    palette_->set_dark_mode(config_.dark_mode);
    wire_controllers();
    hint_->load_preferences();
    refresh();
}

PlayerOverlay::~PlayerOverlay()
{
    alive_.reset();
    scheduler_->cancel_all();
}

void PlayerOverlay::wire_controllers()
{
    expansion_->set_on_expand_start(
        [this]()
        {
            load_queue();
            readout_->sample(scheduler_->elapsed_seconds());
            start_readout_timer();
        });
    expansion_->set_on_expanded([this]() { queue_panel_->set_host_expanded(true); });
    expansion_->set_on_collapse_start(
        [this]()
        {
            queue_panel_->force_close();
            queue_panel_->set_host_expanded(false);
        });
    expansion_->set_on_collapsed(
        [this]()
        {
            queue_panel_->force_close();
            stop_readout_timer();
        });

    queue_panel_->set_on_refresh([this]() { load_queue(); });

    swipe_->set_on_commit(
        [this](const PlaybackTarget& target)
        {
            ARIA_LOG_INFO("player", "Switching to '{}' by swipe", target.name);
            hint_->mark_learned();
            run_command("select_target",
                        [this, target](CommandCallback cb) { source_.select_target(target, std::move(cb)); });
            refresh();
        });
    swipe_->set_on_resolved(
        [](bool committed)
        { ARIA_LOG_DEBUG("swipe", "Gesture resolved ({})", committed ? "committed" : "cancelled"); });
}

// ─── Upstream ───────────────────────────────────────────────────────────────

void PlayerOverlay::refresh()
{
    // All or nothing: a failed read keeps the previous snapshot intact
    bool                          connected = false;
    std::optional<PlaybackTarget> selected;
    std::optional<Track>          track;
    std::vector<PlaybackTarget>   targets;
    std::optional<PlayerQueue>    queue;
    try
    {
        connected = source_.is_connected();
        selected  = source_.selected_target();
        track     = source_.current_track();
        targets   = source_.available_targets();
        queue     = source_.queue_snapshot();
    }
    catch (const std::exception& e)
    {
        ARIA_LOG_WARN("player", "Reading playback state failed: {}", e.what());
        return;
    }
    connected_ = connected;
    selected_  = std::move(selected);
    track_     = std::move(track);
    targets_   = std::move(targets);
    queue_     = std::move(queue);

    if (!connected_ && swipe_->phase() == SwipePhase::Dragging)
        swipe_->reset();

    readout_->sync(selected_, track_, scheduler_->elapsed_seconds());
    hint_->on_connection_changed(connected_, selected_.has_value());
    request_artwork_colors();
    compose();
}

void PlayerOverlay::set_connected(bool connected)
{
    if (connected_ == connected)
        return;
    connected_ = connected;
    ARIA_LOG_INFO("player", "Connection {}", connected ? "up" : "down");
    if (!connected_)
        swipe_->reset();
    hint_->on_connection_changed(connected_, selected_.has_value());
    compose();
}

void PlayerOverlay::set_screen(const ScreenMetrics& screen)
{
    screen_ = screen;
    compose();
}

void PlayerOverlay::set_dark_mode(bool dark)
{
    palette_->set_dark_mode(dark);
    compose();
}

void PlayerOverlay::set_adaptive_theme(bool enabled)
{
    palette_->set_adaptive_enabled(enabled);
    if (enabled)
        request_artwork_colors();
    compose();
}

void PlayerOverlay::tick(float dt)
{
    scheduler_->advance(dt);
    expansion_->update(dt);
    queue_panel_->update(dt);
    swipe_->update(dt);
    hint_->update(dt);
    hide_.update(dt);
    selector_.update(dt);
    check_selector_bounce();
    compose();
}

void PlayerOverlay::request_artwork_colors()
{
    if (!artwork_ || !track_ || !palette_->adaptive_enabled())
        return;
    try
    {
        auto url = artwork_->artwork_url(*track_, tokens::ARTWORK_PX_EXPANDED);
        if (url)
            palette_->request(*url);
    }
    catch (const std::exception& e)
    {
        ARIA_LOG_WARN("palette", "Artwork lookup for '{}' failed: {}", track_->id, e.what());
    }
}

void PlayerOverlay::load_queue()
{
    if (!selected_)
        return;
    try
    {
        source_.refresh_queue(selected_->id);
        queue_ = source_.queue_snapshot();
    }
    catch (const std::exception& e)
    {
        ARIA_LOG_WARN("queue", "Queue refresh for '{}' failed: {}", selected_->id, e.what());
    }
}

void PlayerOverlay::start_readout_timer()
{
    if (scheduler_->is_scheduled(readout_timer_))
        return;
    readout_timer_ = scheduler_->schedule_periodic(config_.readout_interval,
                                                   [this]()
                                                   { readout_->sample(scheduler_->elapsed_seconds()); });
}

void PlayerOverlay::stop_readout_timer()
{
    scheduler_->cancel(readout_timer_);
    readout_timer_ = FrameScheduler::INVALID_TIMER;
}

bool PlayerOverlay::is_visible() const
{
    return connected_ && selected_.has_value();
}

bool PlayerOverlay::selector_shown() const
{
    return selector_open_ || selector_.value() > 0.0f;
}

// ─── Chrome surface ─────────────────────────────────────────────────────────

float PlayerOverlay::expansion_progress() const
{
    return expansion_->progress();
}

std::optional<Color> PlayerOverlay::expanded_background_color() const
{
    return palette_->expanded_background();
}

bool PlayerOverlay::is_expanded() const
{
    return expansion_->is_expanded();
}

void PlayerOverlay::expand()
{
    if (!is_visible())
        return;
    expansion_->expand();
}

void PlayerOverlay::collapse()
{
    expansion_->collapse();
}

NavBarTint PlayerOverlay::nav_tint()
{
    const auto& snap = notifier_.value();
    return palette_->nav_tint(snap.progress, snap.background, snap.primary);
}

// ─── Commands ───────────────────────────────────────────────────────────────

void PlayerOverlay::run_command(const std::string&                           name,
                                const std::function<void(CommandCallback)>& issue,
                                DoneCallback                                 on_done)
{
    std::weak_ptr<PlayerOverlay*> weak = alive_;
    auto cb = [weak, name, on_done](const CommandResult& result)
    {
        auto self = weak.lock();
        if (!self)
            return;
        (*self)->command_finished(name, result, on_done);
    };

    try
    {
        issue(std::move(cb));
    }
    catch (const std::exception& e)
    {
        command_finished(name, CommandResult::failure(e.what()), on_done);
    }
}

void PlayerOverlay::command_finished(const std::string&   name,
                                     const CommandResult& result,
                                     const DoneCallback&  on_done)
{
    if (!result.ok)
    {
        ARIA_LOG_WARN("player", "Command {} failed: {}", name, result.error);
        notify(result.error.empty() ? config_.strings.command_failed
                                    : config_.strings.command_failed + ": " + result.error);
    }
    if (on_done)
        on_done(result.ok);
}

void PlayerOverlay::notify(const std::string& message)
{
    notification_ = message;
    scheduler_->cancel(notification_timer_);
    notification_timer_ = scheduler_->schedule_once(config_.notification_time,
                                                    [this]()
                                                    {
                                                        notification_.reset();
                                                        notification_timer_ = FrameScheduler::INVALID_TIMER;
                                                    });
}

void PlayerOverlay::play_pause()
{
    if (!selected_)
        return;
    std::string id = selected_->id;
    run_command("play_pause", [this, id](CommandCallback cb) { source_.play_pause(id, std::move(cb)); });
}

void PlayerOverlay::skip_next()
{
    if (!selected_)
        return;
    std::string id = selected_->id;
    run_command("skip_next", [this, id](CommandCallback cb) { source_.skip_next(id, std::move(cb)); });
}

void PlayerOverlay::skip_previous()
{
    if (!selected_)
        return;
    std::string id = selected_->id;
    run_command("skip_previous",
                [this, id](CommandCallback cb) { source_.skip_previous(id, std::move(cb)); });
}

void PlayerOverlay::stop()
{
    if (!selected_)
        return;
    std::string id = selected_->id;
    run_command("stop", [this, id](CommandCallback cb) { source_.stop(id, std::move(cb)); });
}

void PlayerOverlay::toggle_shuffle()
{
    if (!queue_)
    {
        ARIA_LOG_DEBUG("queue", "Shuffle ignored: no queue loaded");
        return;
    }
    std::string queue_id = queue_->target_id;
    bool        current  = queue_->shuffle;
    run_command("toggle_shuffle",
                [this, queue_id, current](CommandCallback cb)
                { source_.toggle_shuffle(queue_id, current, std::move(cb)); },
                [this](bool) { load_queue(); });
}

void PlayerOverlay::cycle_repeat()
{
    if (!queue_)
    {
        ARIA_LOG_DEBUG("queue", "Repeat ignored: no queue loaded");
        return;
    }
    std::string queue_id = queue_->target_id;
    RepeatMode  current  = queue_->repeat;
    run_command("cycle_repeat",
                [this, queue_id, current](CommandCallback cb)
                { source_.cycle_repeat(queue_id, current, std::move(cb)); },
                [this](bool) { load_queue(); });
}

void PlayerOverlay::begin_seek(float seconds)
{
    readout_->begin_seek(seconds);
}

void PlayerOverlay::update_seek(float seconds)
{
    readout_->update_seek(seconds);
}

void PlayerOverlay::commit_seek(float seconds)
{
    if (!selected_)
    {
        readout_->seek_resolved();
        return;
    }
    int         position = readout_->commit_seek(seconds, scheduler_->elapsed_seconds());
    std::string id       = selected_->id;
    run_command("seek",
                [this, id, position](CommandCallback cb) { source_.seek(id, position, std::move(cb)); },
                [this](bool) { readout_->seek_resolved(); });
}

void PlayerOverlay::set_volume(int volume)
{
    if (!selected_)
        return;
    volume         = std::clamp(volume, 0, 100);
    std::string id = selected_->id;
    run_command("set_volume",
                [this, id, volume](CommandCallback cb) { source_.set_volume(id, volume, std::move(cb)); });
}

// ─── Queue, selector, hints ─────────────────────────────────────────────────

bool PlayerOverlay::toggle_queue()
{
    if (!expansion_->is_expanded())
        return false;
    if (!queue_panel_->toggle())
        return false;
    hint_->trigger_bounce();
    return true;
}

void PlayerOverlay::show_target_selector()
{
    if (!connected_ || selector_open_)
        return;
    if (expansion_->is_expanded())
        expansion_->collapse();

    selector_open_           = true;
    selector_bounce_pending_ = false;
    selector_drag_offset_    = 0.0f;
    selector_.animate_to(1.0f, config_.selector.reveal_duration * (1.0f - selector_.value()), ease::ease_out_cubic);
    hint_->mark_learned();
}

void PlayerOverlay::dismiss_target_selector()
{
    if (!selector_open_)
        return;
    selector_open_           = false;
    selector_dragging_       = false;
    selector_drag_offset_    = 0.0f;
    selector_bounce_pending_ = true;
    selector_.animate_to(0.0f, config_.selector.dismiss_duration * selector_.value(), ease::ease_in_cubic);
    check_selector_bounce();
}

// The closing sheet "lands" on the mini player once, on its way down
void PlayerOverlay::check_selector_bounce()
{
    if (!selector_bounce_pending_ || selector_.value() >= config_.selector.bounce_below)
        return;
    selector_bounce_pending_ = false;
    hint_->trigger_bounce();
}

void PlayerOverlay::selector_drag(float dy)
{
    if (!selector_open_ || dy <= 0.0f)
        return;
    selector_dragging_ = true;
    selector_drag_offset_ += dy;
    compose();
}

void PlayerOverlay::selector_drag_end(float velocity)
{
    if (!selector_dragging_)
        return;
    selector_dragging_ = false;

    const float pulled    = selector_drag_offset_;
    selector_drag_offset_ = 0.0f;
    if (pulled > config_.selector.dismiss_distance || velocity > config_.selector.dismiss_velocity)
    {
        ARIA_LOG_DEBUG("player", "Selector pulled down {} px at {} px/s, dismissing", pulled, velocity);
        dismiss_target_selector();
    }
    else
    {
        ARIA_LOG_TRACE("player", "Selector springs back from {} px", pulled);
    }
    compose();
}

void PlayerOverlay::select_target(const std::string& target_id)
{
    auto it = std::find_if(targets_.begin(),
                           targets_.end(),
                           [&](const PlaybackTarget& t) { return t.id == target_id; });
    if (it == targets_.end() || !it->available)
    {
        ARIA_LOG_WARN("player", "Cannot select unknown target '{}'", target_id);
        return;
    }
    PlaybackTarget target = *it;
    run_command("select_target",
                [this, target](CommandCallback cb) { source_.select_target(target, std::move(cb)); });
    dismiss_target_selector();
    refresh();
}

void PlayerOverlay::hide_player()
{
    hide_.forward();
}

void PlayerOverlay::show_player()
{
    hide_.reverse();
}

void PlayerOverlay::skip_hint()
{
    hint_->skip();
}

// ─── Input ──────────────────────────────────────────────────────────────────

bool PlayerOverlay::tap(float x, float y)
{
    const auto& regions = frame_.regions;
    for (auto it = regions.rbegin(); it != regions.rend(); ++it)
    {
        if (it->rect.contains(x, y))
        {
            ARIA_LOG_TRACE("player", "Tap -> {}", gesture_action_name(it->action));
            dispatch(it->action, x, it->rect);
            return true;
        }
    }
    return false;
}

void PlayerOverlay::dispatch(GestureAction action, float x, const Rect& rect)
{
    switch (action)
    {
        case GestureAction::Expand:
            expand();
            break;
        case GestureAction::Collapse:
            collapse();
            break;
        case GestureAction::PlayPause:
            play_pause();
            break;
        case GestureAction::SkipNext:
            skip_next();
            break;
        case GestureAction::SkipPrevious:
            skip_previous();
            break;
        case GestureAction::ToggleShuffle:
            toggle_shuffle();
            break;
        case GestureAction::CycleRepeat:
            cycle_repeat();
            break;
        case GestureAction::ToggleQueue:
            toggle_queue();
            break;
        case GestureAction::Seek:
            if (auto d = readout_->duration(); d && *d > 0.0f)
                commit_seek(rect_fraction(rect, x) * *d);
            break;
        case GestureAction::Volume:
            set_volume(static_cast<int>(std::lround(rect_fraction(rect, x) * 100.0f)));
            break;
        case GestureAction::ShowTargetSelector:
            show_target_selector();
            break;
        case GestureAction::DismissTargetSelector:
            dismiss_target_selector();
            break;
        case GestureAction::SkipHint:
            skip_hint();
            break;
    }
    compose();
}

void PlayerOverlay::horizontal_drag_start(float x, float /*y*/)
{
    drag_route_ = DragRoute::None;
    if (!is_visible())
        return;

    if (expansion_->is_fully_collapsed() && !selector_shown())
    {
        if (swipe_->drag_start(x, screen_.width))
            drag_route_ = DragRoute::Swipe;
    }
    else if (expansion_->is_fully_expanded())
    {
        drag_route_   = DragRoute::Fling;
        drag_start_x_ = x;
    }
}

void PlayerOverlay::horizontal_drag_update(float dx)
{
    if (drag_route_ != DragRoute::Swipe)
        return;
    swipe_->drag_update(dx, frame_.geometry.surface.w);
    compose();
}

void PlayerOverlay::horizontal_drag_end(float velocity)
{
    DragRoute route = drag_route_;
    drag_route_     = DragRoute::None;
    if (route == DragRoute::Swipe)
        swipe_->drag_end(velocity);
    else if (route == DragRoute::Fling && queue_panel_->handle_fling(drag_start_x_, velocity, screen_.width))
        hint_->trigger_bounce();
    compose();
}

void PlayerOverlay::vertical_drag(float delta)
{
    if (delta < -10.0f && !expansion_->is_expanded())
        expand();
    else if (delta > 10.0f && expansion_->is_expanded() && !queue_panel_->is_target_open())
        collapse();
}

bool PlayerOverlay::back()
{
    if (hint_->is_active())
    {
        skip_hint();
        return true;
    }
    if (selector_open_)
    {
        dismiss_target_selector();
        return true;
    }
    if (queue_panel_->is_target_open())
    {
        toggle_queue();
        return true;
    }
    if (expansion_->is_expanded())
    {
        collapse();
        return true;
    }
    return false;
}

// ─── Frame composition ──────────────────────────────────────────────────────

void PlayerOverlay::compose()
{
    const float now = scheduler_->elapsed_seconds();
    const float t   = expansion_->progress();

    PlayerFrame f;
    f.number         = scheduler_->frame_number();
    f.visible        = is_visible();
    f.expansion      = t;
    f.queue_progress = queue_panel_->progress();
    f.swipe_offset   = swipe_->offset();
    f.geometry       = expansion_->geometry(screen_);

    // Bounce and hide only move the collapsed surface
    f.bounce_offset = hint_->bounce_offset() * (1.0f - t);
    f.hide_offset   = hide_.value() * (tokens::MINI_HEIGHT + f.geometry.surface_bottom + HIDE_OVERSHOOT) * (1.0f - t);
    f.geometry.surface.y += f.hide_offset - f.bounce_offset;

    f.colors       = palette_->resolve(t);
    f.notification = notification_;

    const float W = f.geometry.surface.w;

    MiniContentOptions opts;
    opts.hints_enabled     = hint_->hints_enabled();
    opts.available_targets = count_available(targets_);
    opts.swipe_hint        = config_.strings.swipe_hint;

    if (selected_)
    {
        opts.position_sec = readout_->position(now);
        f.current         = build_mini_content(*selected_, track_, artwork_, opts);
    }
    f.current_x = f.geometry.surface.x + f.swipe_offset * W;

    if (const auto& peek = swipe_->peek_target())
    {
        MiniContentOptions peek_opts = opts;
        peek_opts.position_sec.reset();
        float shift    = swipe_->peek_direction() == SwipeDirection::Next ? 1.0f : -1.0f;
        f.peek.visible = true;
        f.peek.x       = f.geometry.surface.x + (f.swipe_offset + shift) * W;
        f.peek.content = build_mini_content(*peek, swipe_->peek_track(), artwork_, peek_opts);
    }

    // Expanded details
    auto& d         = f.details;
    d.track         = track_;
    d.target_name   = selected_ ? selected_->name : std::string();
    d.position_sec  = readout_->displayed();
    d.duration_sec  = readout_->duration();
    d.position_text = PositionReadout::format(d.position_sec);
    d.duration_text = d.duration_sec ? PositionReadout::format(*d.duration_sec) : std::string("--:--");
    d.has_queue     = queue_.has_value();
    d.shuffle       = queue_ ? queue_->shuffle : false;
    d.repeat        = queue_ ? queue_->repeat : RepeatMode::Off;
    d.volume        = selected_ ? selected_->volume : 0;
    d.is_playing    = selected_ && selected_->is_playing();

    f.queue.progress = f.queue_progress;
    f.queue.visible  = t > tokens::FADE_LATE_START && f.queue_progress > 0.0f;
    f.queue.x        = queue_panel_x(f.queue_progress, W);
    f.queue.opacity  = ramp(t, tokens::FADE_LATE_START, 1.0f);
    f.queue.queue    = queue_;

    f.welcome.visible          = hint_->is_welcome_visible();
    f.welcome.backdrop_opacity = hint_->backdrop_opacity();
    f.welcome.content_opacity  = hint_->welcome_opacity();
    f.welcome.title            = config_.strings.welcome_title;
    f.welcome.body             = config_.strings.welcome_body;
    f.welcome.skip_label       = config_.strings.skip_hint;

    f.selector.visible     = selector_shown();
    f.selector.reveal      = selector_.value();
    f.selector.drag_offset = selector_drag_offset_;
    for (const auto& target : targets_)
    {
        if (target.available)
            f.selector.targets.push_back(target);
    }
    f.selector.selected_id = selected_ ? selected_->id : std::string();

    if (f.visible)
        build_regions(f);

    frame_ = std::move(f);

    ExpansionSnapshot snap;
    snap.progress   = t;
    snap.background = palette_->expanded_background();
    if (palette_->adaptive_scheme())
        snap.primary = frame_.colors.primary;
    notifier_.publish(snap);
}

void PlayerOverlay::build_regions(PlayerFrame& f) const
{
    const auto& g  = f.geometry;
    const Rect& s  = g.surface;
    auto&       rs = f.regions;

    rs.push_back({s, expansion_->is_expanded() ? GestureAction::Collapse : GestureAction::Expand});

    if (!expansion_->is_expanded())
    {
        // Collapsed transport: previous, play/pause, next
        float row_w = 2.0f * g.skip_size + g.play_container + 2.0f * g.control_spacing;
        float left  = s.x + g.controls_center_x - row_w * 0.5f;
        float top   = s.y + g.controls_top;
        float skip_top = top + (g.play_container - g.skip_size) * 0.5f;
        rs.push_back({{left, skip_top, g.skip_size, g.skip_size}, GestureAction::SkipPrevious});
        rs.push_back({{left + g.skip_size + g.control_spacing, top, g.play_container, g.play_container},
                      GestureAction::PlayPause});
        rs.push_back({{left + g.skip_size + 2.0f * g.control_spacing + g.play_container,
                       skip_top,
                       g.skip_size,
                       g.skip_size},
                      GestureAction::SkipNext});
    }
    else
    {
        float header_top = s.y + screen_.top_inset;
        rs.push_back({{s.x + tokens::SPACE_1, header_top, HEADER_BUTTON, HEADER_BUTTON}, GestureAction::Collapse});
        rs.push_back({{s.x + HEADER_BUTTON + tokens::SPACE_2,
                       header_top,
                       s.w - 2.0f * (HEADER_BUTTON + tokens::SPACE_2),
                       HEADER_BUTTON},
                      GestureAction::ShowTargetSelector});
        rs.push_back({{s.right() - tokens::SPACE_1 - HEADER_BUTTON, header_top, HEADER_BUTTON, HEADER_BUTTON},
                      GestureAction::ToggleQueue});

        if (!queue_panel_->is_open())
        {
            float pad = g.content_padding;
            rs.push_back({{s.x + pad, s.y + g.progress_top, s.w - 2.0f * pad, SEEK_BAR_H}, GestureAction::Seek});

            // shuffle, previous, play/pause, next, repeat
            float row_w = 4.0f * g.skip_size + g.play_container + 4.0f * g.control_spacing;
            float x     = s.x + g.controls_center_x - row_w * 0.5f;
            float top   = s.y + g.controls_top;
            float skip_top = top + (g.play_container - g.skip_size) * 0.5f;
            for (GestureAction a : {GestureAction::ToggleShuffle, GestureAction::SkipPrevious})
            {
                rs.push_back({{x, skip_top, g.skip_size, g.skip_size}, a});
                x += g.skip_size + g.control_spacing;
            }
            rs.push_back({{x, top, g.play_container, g.play_container}, GestureAction::PlayPause});
            x += g.play_container + g.control_spacing;
            for (GestureAction a : {GestureAction::SkipNext, GestureAction::CycleRepeat})
            {
                rs.push_back({{x, skip_top, g.skip_size, g.skip_size}, a});
                x += g.skip_size + g.control_spacing;
            }

            rs.push_back({{s.x + VOLUME_INSET, s.y + g.volume_top, s.w - 2.0f * VOLUME_INSET, VOLUME_BAR_H},
                          GestureAction::Volume});
        }
    }

    if (selector_open_)
        rs.push_back({{0.0f, 0.0f, screen_.width, screen_.height}, GestureAction::DismissTargetSelector});

    if (f.welcome.visible)
    {
        float bottom = screen_.bottom_nav_space() + tokens::MINI_HEIGHT + tokens::SPACE_8;
        rs.push_back({{(screen_.width - SKIP_BUTTON_W) * 0.5f,
                       screen_.height - bottom - SKIP_BUTTON_H,
                       SKIP_BUTTON_W,
                       SKIP_BUTTON_H},
                      GestureAction::SkipHint});
    }
}

}   // namespace aria
