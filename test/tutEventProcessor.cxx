#include <DriftGeometry.h>
#include <EventData.h>
#include <EventProcessor.h>
#include <HitProjector.h>

#include <tut/tut.hpp>
#include <TRandom3.h>
#include <TVirtualMutex.h>

#include <limits>
#include <vector>

namespace {
    // Anode at z = 0 for every channel, one mm per tick.  Channel 999 is
    // not connected.
    class UnitGeometry : public DriftGeometry {
    public:
        double zCoordinate(unsigned int, unsigned int ioChannel,
                           double driftDistance) const override {
            if (ioChannel == 999) {
                return std::numeric_limits<double>::quiet_NaN();
            }
            return driftDistance;
        }
        double driftVelocity() const override { return 1.0; }
        double tickDuration() const override { return 1.0; }
    };
}

namespace tut {
    struct baseEventProcessor {
        baseEventProcessor() {
            fParams.dbscanEps = 2.0;
            fParams.dbscanMinSamples = 3;
            fParams.ransacMinSamples = 2;
            fParams.ransacResidualThreshold = 0.5;
            fParams.ransacMaxTrials = 50;
            fParams.maxIterations = 5;
            fParams.seed = 12345;
        }
        ~baseEventProcessor() {
            // Run after each test.
        }

        // A vertical track of ten hits drifting from t0 = 100, plus an
        // empty slot in the middle.
        Event VerticalTrack(uint64_t eventId) {
            Event ev;
            ev.eventId = eventId;
            ev.t0.eventId = eventId;
            ev.t0.ts = 100.0;
            for (int i = 0; i < 10; ++i) {
                Hit h;
                h.id = eventId*100 + i;
                h.ts = 100.0 + i;
                h.q = 2.5;
                h.px = 3.0;
                h.py = -1.0;
                ev.hits.push_back(h);
                if (i == 4) {
                    Hit empty;
                    empty.valid = false;
                    empty.id = 9999;
                    ev.hits.push_back(empty);
                }
            }
            return ev;
        }

        TrackletParams fParams;
        UnitGeometry fGeometry;
    };

    // Declare the test
    typedef test_group<baseEventProcessor>::object testEventProcessor;
    test_group<baseEventProcessor> groupEventProcessor("EventProcessor");

    // One event from hits to tracks and relations.
    template<> template<> void testEventProcessor::test<1> () {
        EventProcessor processor(fGeometry, fParams);
        EventTracklets out = processor.processEvent(VerticalTrack(7));
        ensure_equals("Event id", out.eventId, 7UL);
        ensure_equals("Valid hits", out.nValidHits, 10u);
        ensure_equals("One track", out.tracks.size(), 1u);

        const Track& t = out.tracks[0];
        ensure_equals("Hits", t.nhit, 10L);
        ensure_distance("Charge", t.q, 25.0, 1E-9);
        ensure_distance("Start time", t.tsStart, 100.0, 1E-9);
        ensure_distance("End time", t.tsEnd, 109.0, 1E-9);
        ensure_distance("Vertical", t.theta, 0.0, 1E-6);
        ensure_distance("Crosses z = 0 at x", t.xp, 3.0, 1E-6);
        ensure_distance("Crosses z = 0 at y", t.yp, -1.0, 1E-6);
        ensure_distance("Length", t.length, 9.0, 1E-6);

        ensure_equals("Relation per hit", out.hitTracks.size(), 10u);
        for (const auto& rel : out.hitTracks) {
            ensure_equals("Local track id", rel.first, 0u);
            ensure("Empty slot not related", rel.second != 9999);
        }
    }

    // Empty events are not an error.
    template<> template<> void testEventProcessor::test<2> () {
        EventProcessor processor(fGeometry, fParams);
        Event ev;
        ev.eventId = 3;
        ev.t0.eventId = 3;
        EventTracklets out = processor.processEvent(ev);
        ensure_equals("No tracks", out.tracks.size(), 0u);
        ensure_equals("No rounds", out.nRounds, 0);

        Hit lonely;
        lonely.id = 1;
        ev.hits.push_back(lonely);
        out = processor.processEvent(ev);
        ensure_equals("Single hit, no tracks", out.tracks.size(), 0u);
        ensure_equals("No relation", out.hitTracks.size(), 0u);
    }

    // Inputs that do not fit together fail.
    template<> template<> void testEventProcessor::test<3> () {
        EventProcessor processor(fGeometry, fParams);

        Event ev = VerticalTrack(5);
        ev.t0.eventId = 6;
        bool thrown = false;
        try {
            processor.processEvent(ev);
        } catch (const InputMismatchError&) {
            thrown = true;
        }
        ensure("t0 of another event", thrown);

        ev = VerticalTrack(5);
        ev.hits[2].ioChannel = 999;
        thrown = false;
        try {
            processor.processEvent(ev);
        } catch (const GeometryError&) {
            thrown = true;
        }
        ensure("Position off the map", thrown);
    }

    // Results do not depend on the number of threads.
    template<> template<> void testEventProcessor::test<4> () {
        TRandom3 rng(3);
        std::vector<Event> events;
        for (uint64_t e = 0; e < 12; ++e) {
            Event ev = VerticalTrack(e);
            for (int i = 0; i < 40; ++i) {
                Hit h;
                h.id = e*100 + 50 + i;
                h.ts = 100.0 + rng.Uniform(20);
                h.q = 1.0;
                h.px = rng.Uniform(-10, 10);
                h.py = rng.Uniform(-10, 10);
                ev.hits.push_back(h);
            }
            events.push_back(ev);
        }

        EventProcessor processor(fGeometry, fParams);
        std::vector<EventTracklets> serial = processor.processEvents(events, 1);
        std::vector<EventTracklets> threaded = processor.processEvents(events, 4);
        ensure("ROOT locking enabled", gGlobalMutex != nullptr);
        ensure_equals("Same event count", serial.size(), threaded.size());
        for (std::size_t e = 0; e < serial.size(); ++e) {
            ensure_equals("Event order kept", threaded[e].eventId, events[e].eventId);
            ensure_equals("Same tracks", serial[e].tracks.size(),
                          threaded[e].tracks.size());
            ensure("Same relations", serial[e].hitTracks == threaded[e].hitTracks);
            for (std::size_t t = 0; t < serial[e].tracks.size(); ++t) {
                ensure_equals("Same length", serial[e].tracks[t].length,
                              threaded[e].tracks[t].length);
            }
        }
    }

    // An error in one event reaches the caller.
    template<> template<> void testEventProcessor::test<5> () {
        std::vector<Event> events;
        for (uint64_t e = 0; e < 6; ++e) events.push_back(VerticalTrack(e));
        events[4].hits[0].ioChannel = 999;

        EventProcessor processor(fGeometry, fParams);
        bool thrown = false;
        try {
            processor.processEvents(events, 3);
        } catch (const GeometryError&) {
            thrown = true;
        }
        ensure("Rethrown after the workers stop", thrown);
    }

    // Event seeds are reproducible, never zero and differ between events.
    template<> template<> void testEventProcessor::test<6> () {
        ensure_equals("Reproducible", EventProcessor::eventSeed(12345, 8),
                      EventProcessor::eventSeed(12345, 8));
        ensure("Events differ",
               EventProcessor::eventSeed(12345, 8) != EventProcessor::eventSeed(12345, 9));
        ensure("Seeds differ",
               EventProcessor::eventSeed(1, 8) != EventProcessor::eventSeed(2, 8));
        for (uint64_t e = 0; e < 1000; ++e) {
            const unsigned long seed = EventProcessor::eventSeed(0, e);
            ensure("Non-zero", seed != 0);
            ensure("32 bits", seed <= 0xffffffffUL);
        }
    }
};

// Local Variables:
// mode:c++
// c-basic-offset:4
// End:
