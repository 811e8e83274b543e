// Scripted session: expand, open the queue, collapse, then swipe to the next
// speaker. Prints a line per interesting frame.

#include <aria/aria.hpp>
#include <cstdio>
#include <map>
#include <string>
#include <vector>

namespace
{

class DemoHousehold : public aria::PlaybackSource
{
   public:
    DemoHousehold()
    {
        add("kitchen", "Kitchen");
        add("living", "Living Room TV");
        add("office", "Office");
        selected_ = "kitchen";

        aria::Track t;
        t.id           = "song-1";
        t.title        = "Blue in Green";
        t.artist       = "Miles Davis";
        t.duration_sec = 337.0f;
        tracks_[selected_] = t;
        targets_[0].state  = aria::PlaybackState::Playing;
    }

    bool is_connected() const override { return true; }

    std::optional<aria::PlaybackTarget> selected_target() const override
    {
        for (const auto& t : targets_)
        {
            if (t.id == selected_)
                return t;
        }
        return std::nullopt;
    }

    std::optional<aria::Track> current_track() const override { return cached_track_for(selected_); }

    std::vector<aria::PlaybackTarget> available_targets() const override { return targets_; }

    std::optional<aria::Track> cached_track_for(const std::string& id) const override
    {
        auto it = tracks_.find(id);
        if (it == tracks_.end())
            return std::nullopt;
        return it->second;
    }

    std::optional<aria::PlayerQueue> queue_snapshot() const override
    {
        aria::PlayerQueue q;
        q.target_id = selected_;
        if (auto t = current_track())
        {
            q.items.push_back({"item-1", *t});
            q.current_index = 0;
        }
        return q;
    }

    void select_target(const aria::PlaybackTarget& target, aria::CommandCallback cb) override
    {
        selected_ = target.id;
        done(cb);
    }
    void toggle_shuffle(const std::string&, bool, aria::CommandCallback cb) override { done(cb); }
    void cycle_repeat(const std::string&, aria::RepeatMode, aria::CommandCallback cb) override { done(cb); }
    void seek(const std::string&, int, aria::CommandCallback cb) override { done(cb); }
    void set_volume(const std::string&, int, aria::CommandCallback cb) override { done(cb); }
    void play_pause(const std::string&, aria::CommandCallback cb) override { done(cb); }
    void stop(const std::string&, aria::CommandCallback cb) override { done(cb); }
    void skip_next(const std::string&, aria::CommandCallback cb) override { done(cb); }
    void skip_previous(const std::string&, aria::CommandCallback cb) override { done(cb); }
    void refresh_queue(const std::string&) override {}

   private:
    void add(const std::string& id, const std::string& name)
    {
        aria::PlaybackTarget t;
        t.id     = id;
        t.name   = name;
        t.volume = 40;
        targets_.push_back(t);
    }

    static void done(const aria::CommandCallback& cb)
    {
        if (cb)
            cb(aria::CommandResult::success());
    }

    std::vector<aria::PlaybackTarget>  targets_;
    std::map<std::string, aria::Track> tracks_;
    std::string                        selected_;
};

class OnboardedPreferences : public aria::PreferenceStore
{
   public:
    bool read_onboarding_completed() const override { return true; }
    void persist_onboarding_completed(bool) override {}
    bool read_hints_enabled() const override { return true; }
    void persist_hints_enabled(bool) override {}
};

void print_frame(const char* label, const aria::PlayerFrame& f)
{
    std::printf("%-10s frame %4llu  t=%.2f  queue=%.2f  swipe=%+.2f  now: %s",
                label,
                static_cast<unsigned long long>(f.number),
                f.expansion,
                f.queue_progress,
                f.swipe_offset,
                f.current.primary.c_str());
    if (f.peek.visible)
        std::printf("  peek: %s (%s)", f.peek.content.primary.c_str(), aria::device_glyph_name(f.peek.content.glyph));
    std::printf("\n");
}

void run(aria::PlayerOverlay& overlay, const char* label, int frames)
{
    for (int i = 0; i < frames; ++i)
    {
        overlay.tick(1.0f / 60.0f);
        if (i % 6 == 0 || i == frames - 1)
            print_frame(label, overlay.frame());
    }
}

}   // namespace

int main()
{
    aria::Logger::instance().set_level(aria::LogLevel::Debug);
    aria::Logger::instance().add_sink(aria::sinks::console_sink());

    DemoHousehold        household;
    OnboardedPreferences prefs;
    aria::PlayerOverlay  overlay(household, nullptr, &prefs);

    overlay.expansion_notifier().subscribe(
        [](const aria::ExpansionSnapshot& s)
        {
            if (s.progress == 0.0f || s.progress == 1.0f)
                ARIA_LOG_INFO("demo", "Chrome sees progress {}", s.progress);
        });

    overlay.expand();
    run(overlay, "expand", 24);

    overlay.toggle_queue();
    run(overlay, "queue", 24);

    overlay.collapse();
    run(overlay, "collapse", 24);

    const float width = overlay.frame().geometry.surface.w;
    overlay.horizontal_drag_start(200.0f, 760.0f);
    for (int i = 1; i <= 10; ++i)
    {
        overlay.horizontal_drag_update(-0.05f * width);
        print_frame("drag", overlay.frame());
    }
    overlay.horizontal_drag_end(-200.0f);
    run(overlay, "settle", 18);

    ARIA_LOG_INFO("demo", "Now on '{}'", overlay.selected_target() ? overlay.selected_target()->name : "nothing");
    return 0;
}
