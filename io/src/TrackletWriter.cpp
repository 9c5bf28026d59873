//
// Created by dylan on 3/9/26.
//

#include "TrackletWriter.h"

#include <stdexcept>

#include "TFile.h"
#include "TTree.h"

TrackletWriter::TrackletWriter(const std::string& outputFileName)
    : outputFileName_(outputFileName)
{
    if (outputFileName_.find(".root") == std::string::npos) {
        outputFileName_ += ".root";
    }
}

long TrackletWriter::write(const std::vector<EventTracklets>& events,
                           const TrackletParams& params) const
{
    TFile fout(outputFileName_.c_str(), "RECREATE");
    if (fout.IsZombie()) {
        throw std::runtime_error("Cannot create output file " + outputFileName_);
    }

    // ------------------------------------------------------------------
    // Tracklets
    // ------------------------------------------------------------------
    TTree trackTree("tracklets", "straight track segments");

    UInt_t    id;
    ULong64_t eventId;
    Double_t  theta, phi, xp, yp;
    Long64_t  nhit;
    Double_t  q, tsStart, tsEnd;
    Double_t  residual[3];
    Double_t  length;
    Double_t  start[3];
    Double_t  end[3];

    trackTree.Branch("id",       &id,       "id/i");
    trackTree.Branch("eventId",  &eventId,  "eventId/l");
    trackTree.Branch("theta",    &theta,    "theta/D");
    trackTree.Branch("phi",      &phi,      "phi/D");
    trackTree.Branch("xp",       &xp,       "xp/D");
    trackTree.Branch("yp",       &yp,       "yp/D");
    trackTree.Branch("nhit",     &nhit,     "nhit/L");
    trackTree.Branch("q",        &q,        "q/D");
    trackTree.Branch("ts_start", &tsStart,  "ts_start/D");
    trackTree.Branch("ts_end",   &tsEnd,    "ts_end/D");
    trackTree.Branch("residual", residual,  "residual[3]/D");
    trackTree.Branch("length",   &length,   "length/D");
    trackTree.Branch("start",    start,     "start[3]/D");
    trackTree.Branch("end",      end,       "end[3]/D");

    // ------------------------------------------------------------------
    // Relations
    // ------------------------------------------------------------------
    TTree hitRefTree("tracklet_hits", "tracklet -> hit");
    UInt_t    refTrackletId;
    ULong64_t refHitId;
    hitRefTree.Branch("trackletId", &refTrackletId, "trackletId/i");
    hitRefTree.Branch("hitId",      &refHitId,      "hitId/l");

    TTree eventRefTree("event_tracklets", "event -> tracklet");
    ULong64_t refEventId;
    eventRefTree.Branch("eventId",    &refEventId,    "eventId/l");
    eventRefTree.Branch("trackletId", &refTrackletId, "trackletId/i");

    long nWritten = 0;
    for (const EventTracklets& ev : events) {
        for (const Track& t : ev.tracks) {
            id      = t.id;
            eventId = ev.eventId;
            theta   = t.theta;
            phi     = t.phi;
            xp      = t.xp;
            yp      = t.yp;
            nhit    = t.nhit;
            q       = t.q;
            tsStart = t.tsStart;
            tsEnd   = t.tsEnd;
            length  = t.length;
            for (int k = 0; k < 3; ++k) {
                residual[k] = t.residual[k];
                start[k]    = t.start[k];
                end[k]      = t.end[k];
            }
            trackTree.Fill();

            refEventId    = ev.eventId;
            refTrackletId = t.id;
            eventRefTree.Fill();
            ++nWritten;
        }

        for (const auto& rel : ev.hitTracks) {
            refTrackletId = rel.first;
            refHitId      = rel.second;
            hitRefTree.Fill();
        }
    }

    // ------------------------------------------------------------------
    // Parameters used for this output
    // ------------------------------------------------------------------
    TTree configTree("tracklet_config", "tracklet reconstruction parameters");
    Double_t  dbscanEps         = params.dbscanEps;
    Int_t     dbscanMinSamples  = params.dbscanMinSamples;
    Int_t     ransacMinSamples  = params.ransacMinSamples;
    Double_t  ransacResidual    = params.ransacResidualThreshold;
    Int_t     ransacMaxTrials   = params.ransacMaxTrials;
    Int_t     maxIterations     = params.maxIterations;
    ULong64_t seed              = params.seed;

    configTree.Branch("dbscan_eps",                &dbscanEps,        "dbscan_eps/D");
    configTree.Branch("dbscan_min_samples",        &dbscanMinSamples, "dbscan_min_samples/I");
    configTree.Branch("ransac_min_samples",        &ransacMinSamples, "ransac_min_samples/I");
    configTree.Branch("ransac_residual_threshold", &ransacResidual,   "ransac_residual_threshold/D");
    configTree.Branch("ransac_max_trials",         &ransacMaxTrials,  "ransac_max_trials/I");
    configTree.Branch("max_iterations",            &maxIterations,    "max_iterations/I");
    configTree.Branch("seed",                      &seed,             "seed/l");
    configTree.Fill();

    trackTree.Write();
    hitRefTree.Write();
    eventRefTree.Write();
    configTree.Write();
    fout.Close();

    return nWritten;
}
