//
// Created by dylan on 3/9/26.
//

#include "HitReader.h"

#include <memory>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include "TFile.h"
#include "TTree.h"

HitReader::HitReader(const std::string& inputFileName,
                     const std::string& hitsTreeName,
                     const std::string& t0TreeName)
    : inputFileName_(inputFileName),
      hitsTreeName_(hitsTreeName),
      t0TreeName_(t0TreeName)
{}

std::vector<Event> HitReader::readEvents() const
{
    std::unique_ptr<TFile> f(TFile::Open(inputFileName_.c_str(), "READ"));
    if (!f || f->IsZombie()) {
        throw std::runtime_error("Cannot open input file " + inputFileName_);
    }

    TTree* t0Tree = nullptr;
    f->GetObject(t0TreeName_.c_str(), t0Tree);
    if (!t0Tree) {
        throw std::runtime_error("Tree '" + t0TreeName_ + "' not found in " + inputFileName_);
    }

    TTree* hitTree = nullptr;
    f->GetObject(hitsTreeName_.c_str(), hitTree);
    if (!hitTree) {
        throw std::runtime_error("Tree '" + hitsTreeName_ + "' not found in " + inputFileName_);
    }

    // ------------------------------------------------------------------
    // One t0 per event
    // ------------------------------------------------------------------
    ULong64_t t0EventId = 0;
    Double_t  t0Ts      = 0;

    if (t0Tree->SetBranchAddress("eventId", &t0EventId) < 0 ||
        t0Tree->SetBranchAddress("ts", &t0Ts) < 0) {
        throw std::runtime_error("Tree '" + t0TreeName_ + "' is missing eventId or ts");
    }

    std::vector<Event> events;
    std::unordered_map<uint64_t, std::size_t> eventIndex;

    const Long64_t nT0 = t0Tree->GetEntries();
    for (Long64_t i = 0; i < nT0; ++i) {
        t0Tree->GetEntry(i);
        if (eventIndex.count(t0EventId)) {
            std::ostringstream msg;
            msg << "Event " << t0EventId << " has more than one t0";
            throw InputMismatchError(msg.str());
        }
        eventIndex[t0EventId] = events.size();

        Event ev;
        ev.eventId = t0EventId;
        ev.t0.eventId = t0EventId;
        ev.t0.ts = t0Ts;
        events.push_back(std::move(ev));
    }

    // ------------------------------------------------------------------
    // Hits
    // ------------------------------------------------------------------
    ULong64_t eventId   = 0;
    ULong64_t hitId     = 0;
    Bool_t    valid     = true;
    Double_t  ts        = 0;
    Double_t  q         = 0;
    UInt_t    ioGroup   = 0;
    UInt_t    ioChannel = 0;
    Double_t  px        = 0;
    Double_t  py        = 0;

    // A branch of the wrong type is left unbound by ROOT, treat it as missing
    auto bind = [&](const char* name, auto* address) {
        if (!hitTree->GetBranch(name)) {
            throw std::runtime_error("Tree '" + hitsTreeName_ + "' has no branch " + name);
        }
        if (hitTree->SetBranchAddress(name, address) < 0) {
            throw std::runtime_error("Tree '" + hitsTreeName_ + "': branch " + name
                                     + " has an unexpected type");
        }
    };

    const bool hasValid = hitTree->GetBranch("valid") != nullptr;
    if (hasValid) bind("valid", &valid);

    bind("eventId",    &eventId);
    bind("hitId",      &hitId);
    bind("ts",         &ts);
    bind("q",          &q);
    bind("io_group",   &ioGroup);
    bind("io_channel", &ioChannel);
    bind("px",         &px);
    bind("py",         &py);

    const Long64_t nEntries = hitTree->GetEntries();
    for (Long64_t i = 0; i < nEntries; ++i) {
        hitTree->GetEntry(i);

        auto it = eventIndex.find(eventId);
        if (it == eventIndex.end()) {
            std::ostringstream msg;
            msg << "Hit " << hitId << " belongs to event " << eventId << " which has no t0";
            throw InputMismatchError(msg.str());
        }

        Hit h;
        h.valid     = hasValid ? static_cast<bool>(valid) : true;
        h.id        = hitId;
        h.ts        = ts;
        h.q         = q;
        h.ioGroup   = ioGroup;
        h.ioChannel = ioChannel;
        h.px        = px;
        h.py        = py;

        events[it->second].hits.push_back(h);
    }

    return events;
}
