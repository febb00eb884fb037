#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "tests/TestRunner.h"
#include "core/Config.h"
#include "utils/ArgumentParser.h"
#include "model/WaitTimesData.h"
#include "events/EventScheduler.h"
#include "display/CardPainter.h"
#include "display/CardRenderer.h"
#include "display/FontManager.h"
#include "display/Freshness.h"
#include "display/FrameComposer.h"
#include "display/ImageLibrary.h"
#include "display/RotationController.h"
#include "display/ThemeCatalog.h"
#include "display/Transition.h"
#include "animation/EventAnimator.h"
#include "animation/FireworksDriver.h"
#include "animation/ParadeDriver.h"
#include "animation/VideoDriver.h"

namespace {
    using TimeHelper::TimePoint;
    using std::chrono::minutes;
    using std::chrono::seconds;

    constexpr Color RED{255, 0, 0};
    constexpr Color GREEN{0, 255, 0};
    constexpr Color BLUE{0, 0, 255};

    TimePoint noonToday() {
        return TimeHelper::atTimeOfDay(TimeHelper::Clock::now(), 12, 0);
    }

    Ride makeRide(uint32_t id, const std::string &name, uint32_t wait, bool open, const std::string &park) {
        Ride r;
        r.id = id;
        r.name = name;
        r.waitTime = wait;
        r.isOpen = open;
        r.parkName = park;
        return r;
    }

    std::shared_ptr<const WaitTimesData> snapshotWithWaits(const std::vector<uint32_t> &waits, TimePoint fetchedAt) {
        auto data = std::make_shared<WaitTimesData>();
        Park park{6, "Magic Kingdom", "magic_kingdom", {}};
        uint32_t id = 1;
        for (uint32_t w : waits) {
            park.rides.push_back(makeRide(id, "Ride " + std::to_string(id), w, true, park.name));
            ++id;
        }
        data->parks.push_back(park);
        data->lastFetch = fetchedAt;
        data->fetchSuccess = true;
        return data;
    }

    /**
     * @brief Painter that records calls and paints flat colors.
     */
    class FakePainter : public CardPainter {
    public:
        int paints{0};
        int cycles{0};
        bool failRides{false};

        int width() const override { return 8; }
        int height() const override { return 4; }

        Surface paintRide(const Ride &ride, const CardContext &) override {
            ++paints;
            if (failRides) {
                throw std::runtime_error("paint failed");
            }
            return Surface(width(), height(), Color{static_cast<uint8_t>(ride.waitTime), 0, 0});
        }

        Surface paintClosedPark(const ClosedPark &, const CardContext &) override {
            ++paints;
            return Surface(width(), height(), GREEN);
        }

        Surface paintEmpty(const CardContext &) override {
            ++paints;
            return Surface(width(), height(), BLUE);
        }

        void advanceImageCycles() override { ++cycles; }
    };

    class FakeAnimator : public ShowAnimator {
    public:
        int begins{0};
        int updates{0};
        int ends{0};
        int renders{0};
        double lastElapsed{-1.0};
        std::optional<ScheduledEvent> event;

        void begin(const ScheduledEvent &e) override {
            ++begins;
            event = e;
        }

        void update(double, double elapsed) override {
            ++updates;
            lastElapsed = elapsed;
        }

        void render(Surface &) override { ++renders; }

        void end() override {
            ++ends;
            event.reset();
        }
    };

    /**
     * @brief In-memory frame source: one flat color per frame.
     */
    class FakeFrameSource : public FrameSource {
    public:
        FakeFrameSource(std::vector<Color> frames, double fps) : frames_{std::move(frames)}, fps_{fps} {
        }

        bool readNext(Surface &out) override {
            if (position_ >= frames_.size()) return false;
            out = Surface(4, 2, frames_[position_++]);
            return true;
        }

        void rewind() override { position_ = 0; }
        double fps() const override { return fps_; }

    private:
        std::vector<Color> frames_;
        double fps_;
        size_t position_{0};
    };

    class FakeVideoCatalog : public VideoCatalog {
    public:
        bool present{false};
        mutable int opens{0};

        bool available(const std::string &) const override { return present; }

        std::unique_ptr<FrameSource> open(const std::string &) const override {
            ++opens;
            return std::make_unique<FakeFrameSource>(std::vector<Color>{GREEN}, 30.0);
        }
    };

    class TempDir {
    public:
        TempDir() {
            char pattern[] = "/tmp/parkwait_test_XXXXXX";
            if (mkdtemp(pattern) == nullptr) {
                throw std::runtime_error("mkdtemp failed");
            }
            path_ = pattern;
        }

        ~TempDir() {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        const std::string &path() const { return path_; }

    private:
        std::string path_;
    };

    /**
     * @brief Records every line of text instead of rasterising it.
     *
     * Each character is half the pixel size wide.
     */
    class FakeText : public TextRenderer {
    public:
        struct Line {
            std::string text;
            int x;
            int y;
            int size;
            Color color;
            std::string theme;
        };

        std::vector<Line> lines;

        int textWidth(const std::string &text, int pixelSize, const std::string &) override {
            return static_cast<int>(FontManager::decodeUtf8(text).size()) * pixelSize / 2;
        }

        int drawText(Surface &, const std::string &text, int x, int y, int pixelSize, Color color,
                     const std::string &theme) override {
            lines.push_back(Line{text, x, y, pixelSize, color, theme});
            return textWidth(text, pixelSize, theme);
        }

        const Line *find(const std::string &text) const {
            for (const auto &line : lines) {
                if (line.text == text) return &line;
            }
            return nullptr;
        }
    };

    void writePpm(const std::string &path, int w, int h, Color c) {
        std::filesystem::create_directories(std::filesystem::path(path).parent_path());
        std::ofstream out(path, std::ios::binary);
        out << "P6\n" << w << " " << h << "\n255\n";
        for (int i = 0; i < w * h; ++i) {
            out.put(static_cast<char>(c.r));
            out.put(static_cast<char>(c.g));
            out.put(static_cast<char>(c.b));
        }
    }

    bool sameColor(const Surface &s, int x, int y, Color expected) {
        return s.pixel(x, y) == expected;
    }

    std::string stateName(const RotationController &rc) {
        return toString(rc.state());
    }

    // ==================== Model ====================

    void testWaitCategories(Test::TestResult &r) {
        r.checkEqual(std::string(toString(waitCategoryFor(0))), std::string("short"), "0 min");
        r.checkEqual(std::string(toString(waitCategoryFor(20))), std::string("short"), "20 min");
        r.checkEqual(std::string(toString(waitCategoryFor(21))), std::string("moderate"), "21 min");
        r.checkEqual(std::string(toString(waitCategoryFor(45))), std::string("moderate"), "45 min");
        r.checkEqual(std::string(toString(waitCategoryFor(46))), std::string("long"), "46 min");
        r.checkEqual(std::string(toString(waitCategoryFor(75))), std::string("long"), "75 min");
        r.checkEqual(std::string(toString(waitCategoryFor(76))), std::string("very_long"), "76 min");

        r.checkEqual(makeRide(1, "A", 35, true, "P").displayWait(), std::string("35 min"), "open ride");
        r.checkEqual(makeRide(1, "A", 0, true, "P").displayWait(), std::string("Walk On"), "zero wait");
        r.checkEqual(makeRide(1, "A", 35, false, "P").displayWait(), std::string("Closed"), "closed ride");
    }

    void testSnapshotQueries(Test::TestResult &r) {
        WaitTimesData data;
        Park epcot{5, "EPCOT", "epcot", {}};
        epcot.rides.push_back(makeRide(1, "Test Track", 40, true, "EPCOT"));
        epcot.rides.push_back(makeRide(2, "Soarin", 70, true, "EPCOT"));
        epcot.rides.push_back(makeRide(3, "Figment", 0, true, "EPCOT"));
        Park mk{6, "Magic Kingdom", "magic_kingdom", {}};
        mk.rides.push_back(makeRide(4, "Space Mountain", 55, true, "Magic Kingdom"));
        mk.rides.push_back(makeRide(5, "Haunted Mansion", 25, false, "Magic Kingdom"));
        Park ak{8, "Animal Kingdom", "animal_kingdom", {}};
        ak.rides.push_back(makeRide(6, "Everest", 0, false, "Animal Kingdom"));
        data.parks = {mk, epcot, ak};

        r.checkEqual(epcot.openRides().size(), size_t{2}, "EPCOT open rides exclude zero wait");

        auto rides = data.allOpenRides();
        if (r.checkEqual(rides.size(), size_t{3}, "open rides across parks")) {
            r.checkEqual(rides[0].name, std::string("Soarin"), "EPCOT sorts first, longest wait first");
            r.checkEqual(rides[1].name, std::string("Test Track"), "second ride");
            r.checkEqual(rides[2].name, std::string("Space Mountain"), "third ride");
        }

        auto closed = data.closedParks();
        if (r.checkEqual(closed.size(), size_t{1}, "closed parks")) {
            r.checkEqual(closed[0].slug, std::string("animal_kingdom"), "closed park slug");
            r.checkEqual(closed[0].opensAt, std::string("9:00 AM"), "default opening time");
        }

        auto queue = buildDisplayQueue(data);
        if (r.checkEqual(queue.size(), size_t{4}, "display queue size")) {
            r.check(std::holds_alternative<Ride>(queue[0]), "queue starts with rides");
            r.check(std::holds_alternative<ClosedPark>(queue[3]), "closed parks come last");
        }
        r.check(data.findPark("epcot") != nullptr, "findPark by slug");
        r.check(data.findPark("atlantis") == nullptr, "findPark unknown slug");
    }

    void testStaleness(Test::TestResult &r) {
        const TimePoint now = noonToday();
        WaitTimesData data;
        r.check(data.isStale(now), "never fetched is stale");
        r.checkEqual(data.ageMinutes(now), int64_t{-1}, "age without fetch");

        data.lastFetch = now - minutes(14);
        r.check(!data.isStale(now), "14 minutes old is fresh");
        r.checkEqual(data.ageMinutes(now), int64_t{14}, "age in minutes");

        data.lastFetch = now - minutes(16);
        r.check(data.isStale(now), "16 minutes old is stale");
    }

    // ==================== Scheduler ====================

    void testParseTime(Test::TestResult &r) {
        r.check(EventScheduler::parseTime("21:00") == 75600u, "21:00");
        r.check(EventScheduler::parseTime("9:05") == 32700u, "9:05");
        r.check(EventScheduler::parseTime(" 08:30 ") == 30600u, "whitespace trimmed");
        r.check(!EventScheduler::parseTime("24:00"), "hour out of range");
        r.check(!EventScheduler::parseTime("12:60"), "minute out of range");
        r.check(!EventScheduler::parseTime("1200"), "missing colon");
        r.check(!EventScheduler::parseTime("12:5"), "single digit minute");
        r.check(!EventScheduler::parseTime("ab:cd"), "non-digits");

        auto entries = EventScheduler::parseSchedule("magic_kingdom=21:00, 22:30; epcot=21:00 ;bogus;;");
        if (r.checkEqual(entries.size(), size_t{2}, "schedule groups")) {
            r.checkEqual(entries[0].first, std::string("magic_kingdom"), "first park");
            r.checkEqual(entries[0].second.size(), size_t{2}, "first park times");
            r.checkEqual(entries[0].second[1], std::string("22:30"), "time trimmed");
            r.checkEqual(entries[1].first, std::string("epcot"), "second park");
        }
    }

    Config::EventsSettings fireworksSchedule(const std::string &schedule) {
        Config::EventsSettings settings;
        settings.fireworks.enabled = true;
        settings.fireworks.duration = 0;
        settings.fireworks.schedule = schedule;
        settings.parades.enabled = false;
        settings.parades.schedule = "magic_kingdom=15:00";
        return settings;
    }

    void testSchedulerBuild(Test::TestResult &r) {
        EventScheduler scheduler(fireworksSchedule("magic_kingdom=21:00;atlantis=20:00;epcot=25:00,21:02"));
        const auto &events = scheduler.events();
        if (!r.checkEqual(events.size(), size_t{2}, "invalid park and time dropped, parades disabled")) {
            return;
        }
        r.checkEqual(events[0].parkSlug, std::string("magic-kingdom"), "hyphenated slug");
        r.checkEqual(events[0].parkName, std::string("Magic Kingdom"), "display name");
        r.checkEqual(events[0].durationSeconds, 240u, "default fireworks duration");
        r.checkEqual(events[0].videoKey(), std::string("magic-kingdom_fireworks"), "video key");
        r.checkEqual(events[1].parkSlug, std::string("epcot"), "second event");
    }

    void testActiveAndNext(Test::TestResult &r) {
        EventScheduler scheduler(fireworksSchedule("magic_kingdom=21:00;epcot=21:02"));
        const TimePoint base = noonToday();

        r.check(!scheduler.activeEvent(TimeHelper::atTimeOfDay(base, 20, 59)), "nothing before start");

        auto at2101 = TimeHelper::atTimeOfDay(base, 21, 1);
        auto active = scheduler.activeEvent(at2101);
        if (r.check(active.has_value(), "active at 21:01")) {
            r.checkEqual(active->elapsedSeconds(at2101), 60u, "elapsed");
            r.checkEqual(active->timeRemaining(at2101), 180u, "remaining");
        }

        auto overlap = scheduler.activeEvent(TimeHelper::atTimeOfDay(base, 21, 3));
        if (r.check(overlap.has_value(), "active during overlap")) {
            r.checkEqual(overlap->parkSlug, std::string("magic-kingdom"), "schedule order wins");
        }

        auto after = scheduler.activeEvent(TimeHelper::atTimeOfDay(base, 21, 4));
        if (r.check(after.has_value(), "second show still running")) {
            r.checkEqual(after->parkSlug, std::string("epcot"), "end is exclusive");
        }
        r.check(!scheduler.activeEvent(TimeHelper::atTimeOfDay(base, 21, 6)), "nothing after last show");

        auto next = scheduler.nextEvent(TimeHelper::atTimeOfDay(base, 20, 0));
        if (r.check(next.has_value(), "next event today")) {
            r.checkEqual(next->event.parkSlug, std::string("magic-kingdom"), "soonest show");
            r.checkEqual(next->secondsUntilStart, int64_t{3600}, "seconds until start");
        }

        auto tomorrow = scheduler.nextEvent(TimeHelper::atTimeOfDay(base, 21, 10));
        if (r.check(tomorrow.has_value(), "next event rolls over")) {
            r.checkEqual(tomorrow->event.parkSlug, std::string("magic-kingdom"), "first show tomorrow");
            r.checkEqual(tomorrow->secondsUntilStart, int64_t{23 * 3600 + 50 * 60}, "seconds until tomorrow");
        }

        r.check(!EventScheduler().nextEvent(base), "empty schedule has no next event");
    }

    /**
     * @brief Switches the process timezone for one test and restores it afterwards.
     */
    class ScopedTimezone {
    public:
        explicit ScopedTimezone(const char *tz) {
            const char *old = getenv("TZ");
            hadOld_ = old != nullptr;
            if (hadOld_) old_ = old;
            setenv("TZ", tz, 1);
            tzset();
        }

        ~ScopedTimezone() {
            if (hadOld_) {
                setenv("TZ", old_.c_str(), 1);
            } else {
                unsetenv("TZ");
            }
            tzset();
        }

    private:
        bool hadOld_{false};
        std::string old_;
    };

    TimePoint localTime(int year, int month, int day, int hour, int minute, int second = 0) {
        struct tm local{};
        local.tm_year = year - 1900;
        local.tm_mon = month - 1;
        local.tm_mday = day;
        local.tm_hour = hour;
        local.tm_min = minute;
        local.tm_sec = second;
        local.tm_isdst = -1;
        return TimeHelper::Clock::from_time_t(mktime(&local));
    }

    void testShowsAcrossDaylightSaving(Test::TestResult &r) {
        // US Eastern rules spelled out so no zoneinfo files are needed
        ScopedTimezone tz("EST5EDT,M3.2.0,M11.1.0");
        EventScheduler scheduler(fireworksSchedule("magic_kingdom=21:00"));

        r.check(scheduler.activeEvent(localTime(2026, 3, 7, 21, 1)).has_value(), "active the day before");

        auto springAt2101 = localTime(2026, 3, 8, 21, 1);
        auto spring = scheduler.activeEvent(springAt2101);
        if (r.check(spring.has_value(), "active at 21:01 on the spring-forward day")) {
            r.checkEqual(spring->elapsedSeconds(springAt2101), 60u, "elapsed from wall-clock start");
        }
        r.check(!scheduler.activeEvent(localTime(2026, 3, 8, 22, 1)), "not shifted an hour late");
        r.check(!scheduler.activeEvent(localTime(2026, 3, 8, 20, 1)), "not shifted an hour early");

        auto next = scheduler.nextEvent(localTime(2026, 3, 8, 20, 0));
        if (r.check(next.has_value(), "next show on the spring-forward day")) {
            r.checkEqual(next->secondsUntilStart, int64_t{3600}, "one hour until 21:00");
        }

        auto overnight = scheduler.nextEvent(localTime(2026, 3, 7, 21, 10));
        if (r.check(overnight.has_value(), "next show across the clock change")) {
            r.checkEqual(overnight->secondsUntilStart, int64_t{22 * 3600 + 50 * 60}, "lost hour not counted");
        }

        auto fallAt2101 = localTime(2026, 11, 1, 21, 1);
        auto fall = scheduler.activeEvent(fallAt2101);
        if (r.check(fall.has_value(), "active at 21:01 on the fall-back day")) {
            r.checkEqual(fall->elapsedSeconds(fallAt2101), 60u, "elapsed on fall-back day");
        }
        r.check(!scheduler.activeEvent(localTime(2026, 11, 1, 20, 1)), "fall-back day not an hour early");
    }

    void testShowStopsAtMidnight(Test::TestResult &r) {
        Config::EventsSettings settings = fireworksSchedule("magic_kingdom=22:00");
        settings.fireworks.duration = 3700;
        EventScheduler scheduler(settings);
        const TimePoint base = noonToday();

        r.check(scheduler.activeEvent(TimeHelper::atTimeOfDay(base, 22, 30)).has_value(), "active at 22:30");
        r.check(scheduler.activeEvent(TimeHelper::atTimeOfDay(base, 23, 1)).has_value(),
                "active past the hour mark");

        const TimePoint afterMidnight = TimeHelper::atTimeOfDay(TimeHelper::nextDay(base), 0, 0) + seconds(30);
        r.check(!scheduler.activeEvent(afterMidnight), "window does not carry past midnight");
    }

    void testInjectTestEvent(Test::TestResult &r) {
        EventScheduler scheduler(fireworksSchedule("magic_kingdom=21:00"));
        const TimePoint now = noonToday();

        r.check(!scheduler.injectTestEvent("bogus", now), "unknown kind rejected");
        r.checkEqual(scheduler.events().size(), size_t{1}, "schedule untouched on rejection");

        r.check(scheduler.injectTestEvent("parade", now), "parade accepted");
        r.checkEqual(scheduler.events().size(), size_t{1}, "test event replaces schedule");
        auto active = scheduler.activeEvent(now);
        if (r.check(active.has_value(), "test event active immediately")) {
            r.checkEqual(std::string(toString(active->type)), std::string("parade"), "type");
            r.checkEqual(active->durationSeconds, 120u, "parade duration");
        }

        r.check(scheduler.injectTestEvent("fireworks-epcot", now), "epcot fireworks accepted");
        auto epcot = scheduler.activeEvent(now);
        if (r.check(epcot.has_value(), "epcot show active")) {
            r.checkEqual(epcot->parkSlug, std::string("epcot"), "park");
            r.checkEqual(epcot->durationSeconds, 240u, "fireworks duration");
        }
    }

    // ==================== Freshness ====================

    void testFreshness(Test::TestResult &r) {
        const TimePoint now = noonToday();

        auto none = Freshness::evaluate(std::nullopt, now, false);
        r.checkEqual(none.ageMinutes, int64_t{-1}, "no fetch age");
        r.check(none.isStale, "no fetch is stale");
        r.check(!none.showBadge(), "no badge without error");

        auto old = Freshness::evaluate(now - minutes(11), now, false);
        r.check(old.badge == FreshnessStatus::Badge::WARNING, "warning after 10 minutes");
        r.checkEqual(old.label, std::string("11m"), "warning label");
        r.check(!old.isStale, "11 minutes is not stale");

        auto fresh = Freshness::evaluate(now - minutes(10), now, false);
        r.check(!fresh.showBadge(), "no badge at exactly 10 minutes");

        auto failed = Freshness::evaluate(now - minutes(5), now, true);
        r.check(failed.badge == FreshnessStatus::Badge::ERROR, "error badge");
        r.checkEqual(failed.label, std::string("5m"), "error label with age");

        auto justFailed = Freshness::evaluate(now - seconds(30), now, true);
        r.checkEqual(justFailed.label, std::string("!"), "error label without age");

        r.check(Freshness::evaluate(now - minutes(16), now, false).isStale, "16 minutes is stale");
        r.check(!Freshness::evaluate(now - minutes(14), now, false).isStale, "14 minutes is fresh");
        r.check(Freshness::badgeColor(FreshnessStatus::Badge::ERROR) == Freshness::ERROR_COLOR, "error color");
    }

    // ==================== Rotation ====================

    struct RotationFixture {
        TimePoint now{noonToday()};
        EventScheduler scheduler;
        FakePainter painter;
        FakeAnimator animator;
        RotationController rotation;

        explicit RotationFixture(EventScheduler s = EventScheduler())
            : scheduler{std::move(s)},
              rotation{scheduler, painter, animator, RotationController::Timing{},
                       [this]() { return now; }} {
        }
    };

    void testRotationTiming(Test::TestResult &r) {
        RotationFixture f;
        f.rotation.setDisplaySnapshot(snapshotWithWaits({10, 30, 50}, f.now));
        r.checkEqual(f.rotation.queueSize(), size_t{3}, "queue size");
        r.checkEqual(stateName(f.rotation), std::string("NORMAL_ROTATION"), "initial state");

        f.rotation.tick(0.0);
        r.checkEqual(f.rotation.currentIndex(), size_t{0}, "zero tick changes nothing");

        f.rotation.tick(7.9);
        r.checkEqual(f.rotation.currentIndex(), size_t{0}, "still on first card before dwell ends");
        r.check(std::holds_alternative<CardFrame>(f.rotation.currentRenderItem()), "card frame while dwelling");
        for (int i = 0; i < 3; ++i) {
            f.rotation.tick(0.0);
        }
        r.checkEqual(f.rotation.dwellSeconds(), 7.9, "zero ticks keep the dwell timer");
        r.checkEqual(stateName(f.rotation), std::string("NORMAL_ROTATION"), "zero ticks keep the state");
        r.checkEqual(f.rotation.currentIndex(), size_t{0}, "zero ticks keep the index");

        f.rotation.tick(0.2);
        r.checkEqual(f.rotation.currentIndex(), size_t{1}, "advanced after dwell");
        r.checkEqual(stateName(f.rotation), std::string("TRANSITIONING"), "transition started");
        r.checkEqual(f.painter.paints, 2, "both cards painted for the transition");

        auto item = f.rotation.currentRenderItem();
        if (r.check(std::holds_alternative<CrossfadeFrame>(item), "crossfade frame")) {
            const auto &frame = std::get<CrossfadeFrame>(item);
            r.check(frame.previous->pixel(0, 0).r == 10, "previous card is the first ride");
            r.check(frame.next->pixel(0, 0).r == 30, "next card is the second ride");
        }

        f.rotation.tick(0.125);
        r.checkEqual(f.rotation.transitionProgress(), 0.25, "progress after quarter");
        for (int i = 0; i < 3; ++i) {
            f.rotation.tick(0.0);
        }
        r.checkEqual(f.rotation.transitionProgress(), 0.25, "zero ticks keep transition progress");
        r.checkEqual(f.rotation.dwellSeconds(), 0.0, "zero ticks keep dwell during transition");
        r.checkEqual(stateName(f.rotation), std::string("TRANSITIONING"), "still transitioning");
        r.checkEqual(f.rotation.currentIndex(), size_t{1}, "index unchanged during transition");
        r.checkEqual(f.painter.paints, 2, "zero ticks paint nothing new");
        f.rotation.tick(0.125);
        r.checkEqual(f.rotation.transitionProgress(), 0.5, "progress after half");
        f.rotation.tick(0.125);
        f.rotation.tick(0.125);
        r.checkEqual(stateName(f.rotation), std::string("NORMAL_ROTATION"), "transition complete");
        r.checkEqual(f.rotation.dwellSeconds(), 0.0, "dwell restarts");
    }

    void testRotationEdges(Test::TestResult &r) {
        RotationFixture empty;
        empty.rotation.tick(10.0);
        r.checkEqual(stateName(empty.rotation), std::string("EMPTY"), "no snapshot is empty");
        r.check(std::holds_alternative<EmptyFrame>(empty.rotation.currentRenderItem()), "empty frame");
        empty.rotation.skip();
        r.checkEqual(stateName(empty.rotation), std::string("EMPTY"), "skip on empty queue");

        RotationFixture single;
        single.rotation.setDisplaySnapshot(snapshotWithWaits({15}, single.now));
        single.rotation.tick(20.0);
        r.checkEqual(stateName(single.rotation), std::string("NORMAL_ROTATION"), "single card never transitions");
        r.checkEqual(single.rotation.currentIndex(), size_t{0}, "single card index");

        RotationFixture wrap;
        wrap.rotation.setDisplaySnapshot(snapshotWithWaits({10, 30, 50}, wrap.now));
        wrap.rotation.skip();
        wrap.rotation.skip();
        r.checkEqual(wrap.rotation.currentIndex(), size_t{2}, "skip advances");
        r.checkEqual(wrap.painter.cycles, 0, "no image cycle before wrap");
        wrap.rotation.skip();
        r.checkEqual(wrap.rotation.currentIndex(), size_t{0}, "wrapped to start");
        r.checkEqual(wrap.painter.cycles, 1, "image cycles advance on wrap");

        wrap.rotation.skip();
        wrap.rotation.skip();
        wrap.rotation.setDisplaySnapshot(snapshotWithWaits({20}, wrap.now));
        r.checkEqual(wrap.rotation.currentIndex(), size_t{0}, "index clamped on shorter snapshot");

        wrap.rotation.setDisplaySnapshot(nullptr);
        r.checkEqual(wrap.rotation.queueSize(), size_t{1}, "null snapshot ignored");
    }

    void testRotationFailureBadge(Test::TestResult &r) {
        RotationFixture f;
        f.rotation.setDisplaySnapshot(snapshotWithWaits({10, 30}, f.now - minutes(5)));
        f.rotation.reportFetchFailure("HTTP 503");
        r.checkEqual(f.rotation.lastError(), std::string("HTTP 503"), "error recorded");
        r.checkEqual(f.rotation.queueSize(), size_t{2}, "old data kept on failure");

        auto item = f.rotation.currentRenderItem();
        if (r.check(std::holds_alternative<CardFrame>(item), "card frame")) {
            const auto &context = std::get<CardFrame>(item).context;
            r.check(context.freshness.badge == FreshnessStatus::Badge::ERROR, "error badge shown");
            r.checkEqual(context.freshness.label, std::string("5m"), "badge label");
            r.checkEqual(context.count, size_t{2}, "context count");
        }

        WeatherData weather;
        weather.temperature = 84.6;
        f.rotation.setWeather(weather);
        f.rotation.setDisplaySnapshot(snapshotWithWaits({10, 30}, f.now));
        r.check(f.rotation.lastError().empty(), "successful snapshot clears error");
        auto after = f.rotation.currentRenderItem();
        if (r.check(std::holds_alternative<CardFrame>(after), "card frame after refresh")) {
            const auto &context = std::get<CardFrame>(after).context;
            r.check(!context.freshness.showBadge(), "badge cleared");
            r.check(context.weather.has_value(), "weather passed to cards");
            if (context.weather) {
                r.checkEqual(context.weather->tempDisplay(), std::string("85\xC2\xB0" "F"), "rounded temperature");
            }
        }
    }

    void testRotationEvent(Test::TestResult &r) {
        Config::EventsSettings settings;
        settings.fireworks.enabled = false;
        settings.parades.enabled = true;
        settings.parades.duration = 120;
        settings.parades.schedule = "magic_kingdom=12:01";
        RotationFixture f{EventScheduler(settings)};
        f.rotation.setDisplaySnapshot(snapshotWithWaits({10, 30, 50}, f.now));

        f.rotation.tick(7.0);
        r.checkEqual(f.animator.begins, 0, "no show before start time");

        f.now += seconds(60);
        f.rotation.tick(0.5);
        r.checkEqual(stateName(f.rotation), std::string("EVENT_ACTIVE"), "show takes over");
        r.checkEqual(f.animator.begins, 1, "animator started");
        r.checkEqual(f.rotation.dwellSeconds(), 7.0, "rotation frozen during show");

        f.now += seconds(10);
        f.rotation.tick(0.5);
        f.rotation.skip();
        r.checkEqual(f.animator.begins, 1, "animator started once");
        r.checkEqual(f.animator.updates, 2, "animator updated every tick");
        r.checkEqual(f.animator.lastElapsed, 10.0, "elapsed measured from detection");
        r.checkEqual(f.rotation.currentIndex(), size_t{0}, "skip ignored during show");

        auto item = f.rotation.currentRenderItem();
        if (r.check(std::holds_alternative<EventFrame>(item), "event frame")) {
            r.checkEqual(std::get<EventFrame>(item).event.parkName, std::string("Magic Kingdom"), "event park");
        }

        f.now += seconds(130);
        f.rotation.tick(0.5);
        r.checkEqual(f.animator.ends, 1, "animator ended");
        r.checkEqual(stateName(f.rotation), std::string("NORMAL_ROTATION"), "rotation resumes");
        r.checkEqual(f.rotation.currentIndex(), size_t{0}, "rotation resumes where it stopped");
    }

    // ==================== Rendering ====================

    void testTransitions(Test::TestResult &r) {
        const Surface red(4, 2, RED);
        const Surface blue(4, 2, BLUE);

        Surface target(4, 2);
        Transition::crossfade(red, blue, 0.0, target);
        r.check(sameColor(target, 0, 0, RED), "crossfade start shows previous");
        Transition::crossfade(red, blue, 1.0, target);
        r.check(sameColor(target, 3, 1, BLUE), "crossfade end shows next");
        Transition::crossfade(red, blue, 0.5, target);
        r.check(target.pixel(1, 1).r == 128 && target.pixel(1, 1).b == 127, "crossfade midpoint blends");

        Transition::slideLeft(red, blue, 0.0, target);
        r.check(sameColor(target, 3, 0, RED), "slide start shows previous");
        Transition::slideLeft(red, blue, 1.0, target);
        r.check(sameColor(target, 0, 0, BLUE), "slide end shows next");

        r.checkEqual(Transition::easeInOut(0.5), 0.5, "ease midpoint");
        r.check(Transition::parse("slide_left") == TransitionType::SLIDE_LEFT, "parse slide_left");
        r.check(Transition::parse("wipe") == TransitionType::CROSSFADE, "unknown falls back to crossfade");
        r.check(Transition::lookup(TransitionType::SLIDE_LEFT) == &Transition::slideLeft, "lookup slide");
    }

    void testThemes(Test::TestResult &r) {
        r.checkEqual(ThemeCatalog::themeForRide("Space Mountain"), std::string("scifi"), "Space Mountain theme");
        r.checkEqual(ThemeCatalog::themeForRide("Haunted Mansion"), std::string("spooky"), "Haunted Mansion theme");
        r.checkEqual(ThemeCatalog::themeForRide("Mystery Ride"), std::string("classic"), "unknown theme");
        r.checkEqual(ThemeCatalog::imageFolderForRide("Pirates of the Caribbean"),
                     std::string("pirates_caribbean"), "Pirates folder");
        r.checkEqual(ThemeCatalog::imageFolderForRide("Mystery Ride"), std::string("generic"), "unknown folder");

        r.check(ThemeCatalog::colorScheme("nope").background == ThemeCatalog::colorScheme("classic").background,
                "unknown scheme falls back to classic");
        r.check(ThemeCatalog::colorScheme("scifi").accent == Color{76, 201, 240}, "scifi accent");
        r.check(ThemeCatalog::waitColor(WaitCategory::SHORT) == Color{46, 204, 113}, "short wait green");
        r.check(ThemeCatalog::waitColor(WaitCategory::VERY_LONG) == Color{231, 76, 60}, "very long wait red");
    }

    void testDotWindow(Test::TestResult &r) {
        using Window = std::pair<size_t, size_t>;
        r.check(CardRenderer::dotWindow(0, 10, 25) == Window{0, 10}, "few cards show all dots");
        r.check(CardRenderer::dotWindow(0, 40, 25) == Window{0, 25}, "window at start");
        r.check(CardRenderer::dotWindow(20, 40, 25) == Window{8, 25}, "window centred");
        r.check(CardRenderer::dotWindow(39, 40, 25) == Window{15, 25}, "window at end");
    }

    void testCardText(Test::TestResult &r) {
        TempDir dir;
        ImageLibrary images(dir.path(), 800, 480);
        FakeText text;
        CardRenderer cards(images, text, 800, 480);
        const TimePoint now = noonToday();

        CardContext context;
        context.count = 3;
        context.freshness = Freshness::evaluate(now - minutes(20), now, false);
        WeatherData weather;
        weather.temperature = 84.2;
        weather.condition = "Clear";
        context.weather = weather;

        Surface ride = cards.paintRide(makeRide(1, "Space Mountain", 45, true, "Magic Kingdom"), context);
        r.checkEqual(ride.width(), 800, "card width");
        const auto *wait = text.find("45 min");
        if (r.check(wait != nullptr, "wait drawn")) {
            r.checkEqual(wait->size, 80, "wait headline size");
            r.check(wait->color == ThemeCatalog::waitColor(WaitCategory::MODERATE), "wait coloured by category");
            r.checkEqual(wait->x, (800 - 6 * 40) / 2, "wait centred");
            r.checkEqual(wait->theme, std::string("scifi"), "ride theme font");
        }
        const auto *name = text.find("Space Mountain");
        if (r.check(name != nullptr, "ride name drawn") && wait != nullptr) {
            r.checkEqual(name->y, wait->y + 80, "name below wait");
        }
        const auto *badge = text.find("20m");
        if (r.check(badge != nullptr, "badge shows data age")) {
            r.check(badge->color == Color{0, 0, 0}, "badge text is black");
            r.check(badge->x > 700 && badge->y < 60, "badge in the top-right corner");
        }
        r.check(text.find("84\xC2\xB0" "F") != nullptr, "temperature drawn");

        text.lines.clear();
        context.freshness = Freshness::evaluate(now - minutes(2), now, false);
        cards.paintRide(makeRide(2, std::string(60, 'A'), 10, true, "EPCOT"), context);
        r.check(text.find("2m") == nullptr, "no badge text on fresh data");
        bool truncated = false;
        for (const auto &line : text.lines) {
            if (line.size == 36 && line.text.size() > 3 &&
                line.text.compare(line.text.size() - 3, 3, "...") == 0) {
                truncated = true;
                r.check(text.textWidth(line.text, 36, "") <= 760, "truncated name fits");
            }
        }
        r.check(truncated, "long name truncated with an ellipsis");
        r.checkEqual(cards.fitText("Short", 760, 36, ""), std::string("Short"), "short name untouched");
        r.checkEqual(cards.fitText("ABCDEFGHIJKLMN", 10, 36, ""), std::string("ABCDEFG..."),
                     "truncation stops at ten characters");

        text.lines.clear();
        cards.paintClosedPark(ClosedPark{"EPCOT", "epcot", "9:00 AM"}, context);
        const auto *closed = text.find("CLOSED");
        if (r.check(closed != nullptr, "CLOSED drawn")) {
            r.check(closed->color == Color{231, 76, 60}, "CLOSED in red");
            r.checkEqual(closed->x, (800 - 6 * 40) / 2, "CLOSED centred");
        }
        r.check(text.find("EPCOT") != nullptr, "park name drawn");
        r.check(text.find("Opens at 9:00 AM") != nullptr, "opening time drawn");

        text.lines.clear();
        context.freshness = Freshness::evaluate(now - minutes(3), now, false);
        cards.paintEmpty(context);
        r.check(text.find("No rides currently reporting wait times") != nullptr, "empty message");
        r.check(text.find("Parks may be closed") != nullptr, "empty sub-message");
        r.check(text.find("Last updated: 3 minutes ago") != nullptr, "last update age");
    }

    void testFontManager(Test::TestResult &r) {
        auto decoded = FontManager::decodeUtf8("84\xC2\xB0" "F");
        if (r.checkEqual(decoded.size(), size_t{4}, "UTF-8 degree sign is one codepoint")) {
            r.check(decoded[2] == U'\u00B0', "degree sign decoded");
        }
        auto bad = FontManager::decodeUtf8("a\xFF" "b\xC2");
        if (r.checkEqual(bad.size(), size_t{4}, "malformed bytes kept as replacements")) {
            r.check(bad[1] == U'\uFFFD' && bad[3] == U'\uFFFD', "replacement characters");
            r.check(bad[2] == U'b', "decoding resumes after a bad byte");
        }

        TempDir dir;
        FontManager none(dir.path(), {});
        r.check(!none.hasFont("scifi"), "no font without files");
        Surface blank(40, 20);
        r.checkEqual(none.drawText(blank, "20m", 0, 0, 16, Color{255, 255, 255}, "classic"), 0, "nothing drawn");
        r.check(sameColor(blank, 5, 10, Color{}), "surface untouched");

        std::string system;
        for (const auto &path : FontManager::systemFonts()) {
            if (std::filesystem::exists(path)) {
                system = path;
                break;
            }
        }
        if (system.empty()) {
            r.addWarning("no system TrueType font installed, glyph rasterising not exercised");
            return;
        }

        FontManager fonts(dir.path(), {system});
        r.check(fonts.hasFont("scifi"), "missing theme font falls back to a system font");
        const int shortWidth = fonts.textWidth("20m", 22, "classic");
        r.check(shortWidth > 0, "text has width");
        r.check(fonts.textWidth("120m", 22, "classic") > shortWidth, "longer text is wider");

        Surface surface(120, 40);
        const int drawn = fonts.drawText(surface, "20m", 4, 4, 22, Color{255, 255, 255}, "classic");
        r.checkEqual(drawn, shortWidth, "drawn advance matches measured width");
        bool lit = false;
        for (int y = 0; y < surface.height() && !lit; ++y) {
            for (int x = 0; x < surface.width(); ++x) {
                if (surface.pixel(x, y).r > 0) {
                    lit = true;
                    break;
                }
            }
        }
        r.check(lit, "glyph pixels rasterised");
    }

    void testSurfaceAndPpm(Test::TestResult &r) {
        TempDir dir;
        Surface s(4, 4, RED);
        s.fillRect(0, 0, 2, 2, BLUE, 255);
        r.check(sameColor(s, 1, 1, BLUE), "opaque fill");
        r.check(sameColor(s, 2, 2, RED), "fill clipped to rect");
        s.fillRect(-5, -5, 100, 100, GREEN, 0);
        r.check(sameColor(s, 3, 3, RED), "transparent fill is a no-op");
        s.setPixel(10, 10, GREEN);
        r.check(s.pixel(10, 10) == Color{}, "out of bounds reads black");

        const std::string good = dir.path() + "/good.ppm";
        writePpm(good, 3, 2, GREEN);
        Surface loaded;
        if (r.check(loadPpm(good, loaded), "valid P6 loads")) {
            r.checkEqual(loaded.width(), 3, "width");
            r.checkEqual(loaded.height(), 2, "height");
            r.check(sameColor(loaded, 2, 1, GREEN), "pixel data");
        }

        const std::string ascii = dir.path() + "/ascii.ppm";
        {
            std::ofstream out(ascii);
            out << "P3\n1 1\n255\n0 0 0\n";
        }
        r.check(!loadPpm(ascii, loaded), "P3 rejected");

        const std::string truncated = dir.path() + "/short.ppm";
        {
            std::ofstream out(truncated, std::ios::binary);
            out << "P6\n4 4\n255\n" << "abc";
        }
        r.check(!loadPpm(truncated, loaded), "truncated data rejected");
        r.check(!loadPpm(dir.path() + "/missing.ppm", loaded), "missing file rejected");
    }

    void testImageLibrary(Test::TestResult &r) {
        TempDir dir;
        writePpm(dir.path() + "/images/space_mountain/a.ppm", 2, 2, RED);
        writePpm(dir.path() + "/images/space_mountain/b.ppm", 2, 2, BLUE);
        writePpm(dir.path() + "/images/parks/magic_kingdom.ppm", 2, 2, GREEN);

        ImageLibrary images(dir.path(), 4, 4);
        r.checkEqual(images.imageCount("space_mountain"), size_t{2}, "folder image count");
        r.check(sameColor(images.rideImage("Space Mountain", "scifi"), 3, 3, RED), "first image scaled");

        images.advanceAllCycles();
        r.checkEqual(images.cycleIndex("space_mountain"), size_t{1}, "cycle advanced");
        r.check(sameColor(images.rideImage("Space Mountain", "scifi"), 0, 0, BLUE), "second image");
        images.advanceAllCycles();
        r.check(sameColor(images.rideImage("Space Mountain", "scifi"), 0, 0, RED), "cycle wraps");

        const Surface &fallback = images.rideImage("Mystery Ride", "classic");
        r.check(fallback.pixel(0, 0) == images.gradient("classic").pixel(0, 0), "gradient placeholder");
        r.checkEqual(images.cycleIndex("generic"), size_t{0}, "empty folder never cycles");

        const Surface *park = images.parkImage("magic_kingdom");
        if (r.check(park != nullptr, "park image loaded")) {
            r.check(sameColor(*park, 1, 1, GREEN), "park image pixels");
        }
        r.check(images.parkImage("epcot") == nullptr, "missing park image");
    }

    void testComposer(Test::TestResult &r) {
        FakePainter painter;
        FakeAnimator animator;
        FrameComposer composer(painter, animator);
        Surface target(8, 4);

        CardFrame card{makeRide(1, "Tron", 40, true, "Magic Kingdom"), CardContext{}};
        composer.compose(card, target);
        r.check(target.pixel(0, 0).r == 40, "card painted");

        painter.failRides = true;
        composer.compose(card, target);
        r.check(sameColor(target, 0, 0, Color{30, 0, 0}), "failed card becomes error placeholder");

        composer.compose(EmptyFrame{}, target);
        r.check(sameColor(target, 0, 0, BLUE), "empty frame");

        ScheduledEvent show{EventType::FIREWORKS, "EPCOT", "epcot", 0, 240};
        composer.compose(EventFrame{show, 3.0}, target);
        r.check(sameColor(target, 0, 0, Color{10, 10, 30}), "show background");
        r.checkEqual(animator.renders, 1, "animator rendered");

        auto red = std::make_shared<const Surface>(8, 4, RED);
        auto blue = std::make_shared<const Surface>(8, 4, BLUE);
        composer.compose(CrossfadeFrame{red, blue, 1.0, TransitionType::CROSSFADE}, target);
        r.check(sameColor(target, 7, 3, BLUE), "crossfade composed");
    }

    // ==================== Animation ====================

    bool anyLit(const Surface &s) {
        for (const auto &c : s.pixels()) {
            if (c != Color{}) return true;
        }
        return false;
    }

    void testFireworks(Test::TestResult &r) {
        FireworksDriver fireworks(800, 480, 42);
        fireworks.reset();
        fireworks.update(1.0 / 60, 0.2);
        r.check(fireworks.rockets().empty(), "no launch before first interval");

        fireworks.update(1.0 / 60, 0.31);
        if (r.checkEqual(fireworks.rockets().size(), size_t{1}, "first rocket launched")) {
            r.check(!fireworks.rockets()[0].exploded, "rocket climbing");
            r.check(fireworks.rockets()[0].y < 490.0f, "rocket moved up");
        }

        bool sawExplosion = false;
        double t = 0.31;
        for (int frame = 0; frame < 60; ++frame) {
            t += 1.0 / 60;
            fireworks.update(1.0 / 60, t);
            for (const auto &rocket : fireworks.rockets()) {
                if (rocket.exploded) {
                    sawExplosion = true;
                    r.check(rocket.particles.size() >= 60 && rocket.particles.size() <= 100,
                            "burst has 60-100 particles");
                }
            }
        }
        r.check(sawExplosion, "rocket exploded");

        Surface canvas(800, 480);
        fireworks.render(canvas);
        r.check(anyLit(canvas), "fireworks drawn");

        fireworks.reset();
        r.check(fireworks.rockets().empty(), "reset clears rockets");
    }

    void testParade(Test::TestResult &r) {
        ParadeDriver parade(800, 480, 7);
        parade.reset();

        double t = 0.0;
        for (int frame = 0; frame < 200; ++frame) {
            t += 0.05;
            parade.update(0.05, t);
        }
        r.check(!parade.elements().empty(), "elements spawned");
        for (const auto &e : parade.elements()) {
            if (e.x < -50 || e.x > 850 || e.y < -50 || e.y > 530) {
                r.addFailure("element left on screen past margin");
                break;
            }
        }

        parade.update(0.0, 2.0);
        r.checkEqual(parade.bannerOffset(), 100.0, "banner scrolls 50 px/s");
        parade.update(0.0, 17.0);
        r.checkEqual(parade.bannerOffset(), 50.0, "banner wraps at width");

        Surface canvas(800, 480);
        parade.render(canvas);
        r.check(anyLit(canvas), "parade drawn");

        parade.reset();
        r.check(parade.elements().empty(), "reset clears elements");
    }

    void testVideoDriver(Test::TestResult &r) {
        VideoDriver video(std::make_unique<FakeFrameSource>(std::vector<Color>{RED, GREEN, BLUE}, 4.0));
        video.reset();
        r.checkEqual(video.framesShown(), uint64_t{1}, "first frame on reset");

        Surface canvas(4, 2);
        video.render(canvas);
        r.check(sameColor(canvas, 0, 0, RED), "first frame");

        video.update(0.1, 0.1);
        r.checkEqual(video.framesShown(), uint64_t{1}, "frame held until its duration passes");
        video.update(0.15, 0.25);
        video.render(canvas);
        r.check(sameColor(canvas, 0, 0, GREEN), "second frame");

        video.update(0.25, 0.5);
        video.update(0.25, 0.75);
        video.render(canvas);
        r.check(sameColor(canvas, 0, 0, RED), "video loops at end");
        r.checkEqual(video.framesShown(), uint64_t{4}, "frames read");
    }

    void testEventAnimator(Test::TestResult &r) {
        FakeVideoCatalog catalog;
        EventAnimator animator(64, 48, &catalog, 3);
        r.checkEqual(std::string(animator.activeDriverName()), std::string("none"), "idle");

        animator.begin(ScheduledEvent{EventType::FIREWORKS, "EPCOT", "epcot", 0, 240});
        animator.update(0.1, 0.1);
        r.checkEqual(std::string(animator.activeDriverName()), std::string("fireworks"), "procedural fireworks");

        catalog.present = true;
        animator.update(0.1, 0.2);
        r.checkEqual(std::string(animator.activeDriverName()), std::string("video"), "video preferred");
        animator.update(0.1, 0.3);
        r.checkEqual(catalog.opens, 1, "video opened once");

        Surface canvas(64, 48);
        animator.render(canvas);
        r.check(sameColor(canvas, 0, 0, GREEN), "video frame rendered");

        catalog.present = false;
        animator.update(0.1, 0.4);
        r.checkEqual(std::string(animator.activeDriverName()), std::string("fireworks"), "fallback when video gone");

        animator.end();
        r.checkEqual(std::string(animator.activeDriverName()), std::string("none"), "ended");

        animator.begin(ScheduledEvent{EventType::PARADE, "Magic Kingdom", "magic-kingdom", 0, 120});
        r.checkEqual(std::string(animator.activeDriverName()), std::string("parade"), "procedural parade");

        EventAnimator noCatalog(64, 48, nullptr, 3);
        noCatalog.begin(ScheduledEvent{EventType::PARADE, "EPCOT", "epcot", 0, 120});
        noCatalog.update(0.1, 0.1);
        r.checkEqual(std::string(noCatalog.activeDriverName()), std::string("parade"), "no catalog");
    }

    // ==================== Config ====================

    void testConfigLoad(Test::TestResult &r) {
        TempDir dir;
        const std::string envPath = dir.path() + "/parkwait.env";
        {
            std::ofstream out(envPath);
            out << "# kiosk settings\n"
                << "export PARKWAIT_DISPLAY_FPS=45\n"
                << "PARKWAIT_WEB_PORT=9090\r\n"
                << "not a pair\n"
                << "PARKWAIT_ROTATION_TRANSITION=crossfade\n";
        }
        setenv("PARKWAIT_ROTATION_TRANSITION", "slide_left", 1);

        r.check(Config::loadEnvFile(envPath, true), "env file read");
        r.check(!Config::loadEnvFile(dir.path() + "/missing.env", false), "optional missing file");
        try {
            Config::loadEnvFile(dir.path() + "/missing.env", true);
            r.addFailure("required missing file should throw");
        } catch (const std::runtime_error &) {
        }

        auto config = Config::load();
        r.checkEqual(config.display.fps, 45u, "export prefix handled");
        r.checkEqual(config.web.port, 9090u, "CRLF stripped");
        r.checkEqual(config.rotation.transition, std::string("slide_left"), "environment wins over file");
        r.checkEqual(config.display.width, 800u, "default width");
        r.checkEqual(config.api.refreshInterval, 300u, "default refresh interval");

        setenv("PARKWAIT_DISPLAY_WIDTH", "wide", 1);
        try {
            Config::load();
            r.addFailure("malformed integer should throw");
        } catch (const std::runtime_error &) {
        }
        setenv("PARKWAIT_DISPLAY_WIDTH", "-5", 1);
        try {
            Config::load();
            r.addFailure("negative integer should throw");
        } catch (const std::runtime_error &) {
        }

        unsetenv("PARKWAIT_DISPLAY_WIDTH");
        unsetenv("PARKWAIT_DISPLAY_FPS");
        unsetenv("PARKWAIT_WEB_PORT");
        unsetenv("PARKWAIT_ROTATION_TRANSITION");
    }

    void testConfigValidate(Test::TestResult &r) {
        Config::AppConfig config;
        try {
            Config::validate(config);
        } catch (const std::runtime_error &e) {
            r.addFailure(std::string("defaults should validate: ") + e.what());
        }

        auto expectInvalid = [&r](Config::AppConfig c, const std::string &what) {
            try {
                Config::validate(c);
                r.addFailure(what + " should be rejected");
            } catch (const std::runtime_error &) {
            }
        };

        Config::AppConfig badFps;
        badFps.display.fps = 0;
        expectInvalid(badFps, "fps 0");

        Config::AppConfig badPort;
        badPort.web.port = 70000;
        expectInvalid(badPort, "port 70000");

        Config::AppConfig badDuration;
        badDuration.rotation.displayDuration = 0.0f;
        expectInvalid(badDuration, "zero display duration");
    }

    std::vector<char *> argvOf(std::vector<std::string> &args) {
        std::vector<char *> argv;
        for (auto &a : args) argv.push_back(a.data());
        argv.push_back(nullptr);
        return argv;
    }

    void testArguments(Test::TestResult &r) {
        std::vector<std::string> full{"parkwait", "--text-only", "--fullscreen", "--config", "/etc/parkwait.env",
                                      "--log-level", "DEBUG", "--no-console-log", "--test-event", "parade"};
        auto argv = argvOf(full);
        ArgumentParser::AppArgs args;
        if (r.check(ArgumentParser::parseAppArgs(static_cast<int>(full.size()), argv.data(), args), "valid args")) {
            r.check(args.textOnly && args.fullscreen && !args.consoleLog, "flags");
            r.checkEqual(args.configPath, std::string("/etc/parkwait.env"), "config path");
            r.checkEqual(args.logLevel, std::string("DEBUG"), "log level");
            r.checkEqual(args.testEvent, std::string("parade"), "test event");
        }

        std::vector<std::string> badLevel{"parkwait", "--log-level", "LOUD"};
        auto argv2 = argvOf(badLevel);
        ArgumentParser::AppArgs args2;
        r.check(!ArgumentParser::parseAppArgs(3, argv2.data(), args2), "invalid level rejected");

        std::vector<std::string> badEvent{"parkwait", "--test-event", "concert"};
        auto argv3 = argvOf(badEvent);
        ArgumentParser::AppArgs args3;
        r.check(!ArgumentParser::parseAppArgs(3, argv3.data(), args3), "invalid test event rejected");

        std::vector<std::string> missing{"parkwait", "--config"};
        auto argv4 = argvOf(missing);
        ArgumentParser::AppArgs args4;
        r.check(!ArgumentParser::parseAppArgs(2, argv4.data(), args4), "missing value rejected");
    }
}

int main(int argc, char *argv[]) {
    Test::TestRunner runner("PARKWAIT CORE TESTS");

    runner.add("Wait Categories", "Category bounds and wait labels", testWaitCategories);
    runner.add("Snapshot Queries", "Open rides, ordering, closed parks, display queue", testSnapshotQueries);
    runner.add("Staleness", "Snapshot age and stale threshold", testStaleness);
    runner.add("Parse Time", "HH:MM parsing and schedule strings", testParseTime);
    runner.add("Scheduler Build", "Schedule expansion with invalid entries dropped", testSchedulerBuild);
    runner.add("Active And Next Event", "Show windows, overlap order, next-day rollover", testActiveAndNext);
    runner.add("Shows Across Daylight Saving", "Show start stays on the wall clock", testShowsAcrossDaylightSaving);
    runner.add("Show Stops At Midnight", "Windows are evaluated within one calendar day", testShowStopsAtMidnight);
    runner.add("Test Event Injection", "Forced shows replace the schedule", testInjectTestEvent);
    runner.add("Freshness", "Badge kind and label", testFreshness);
    runner.add("Rotation Timing", "Dwell, transition progress and completion", testRotationTiming);
    runner.add("Rotation Edges", "Empty queue, single card, wrap, index clamp", testRotationEdges);
    runner.add("Rotation Failure Badge", "Fetch failure keeps data and flags the card", testRotationFailureBadge);
    runner.add("Rotation Event", "Shows freeze rotation and drive the animator", testRotationEvent);
    runner.add("Transitions", "Crossfade and slide blending", testTransitions);
    runner.add("Themes", "Ride themes, image folders, color schemes", testThemes);
    runner.add("Dot Window", "Progress dot windowing", testDotWindow);
    runner.add("Card Text", "Wait, names, closed park and badge label on cards", testCardText);
    runner.add("Font Manager", "UTF-8 decoding, font fallback and glyph rasterising", testFontManager);
    runner.add("Surface And PPM", "Drawing primitives and image loading", testSurfaceAndPpm);
    runner.add("Image Library", "Folder loading, cycling, placeholders", testImageLibrary);
    runner.add("Frame Composer", "Render item dispatch and error placeholder", testComposer);
    runner.add("Fireworks", "Rocket launch, burst and render", testFireworks);
    runner.add("Parade", "Element spawning, culling and banner scroll", testParade);
    runner.add("Video Driver", "Frame pacing and looping", testVideoDriver);
    runner.add("Event Animator", "Video preferred over procedural show", testEventAnimator);
    runner.add("Config Load", "Env file parsing and strict numbers", testConfigLoad);
    runner.add("Config Validate", "Range checks", testConfigValidate);
    runner.add("Arguments", "Command-line parsing", testArguments);

    return Test::runMain(runner, argc, argv);
}
