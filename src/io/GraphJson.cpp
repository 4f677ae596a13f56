#include "io/GraphJson.hpp"

using json = nlohmann::json;

static const char* event_kind_str(graph::EventKind k) {
    switch (k) {
        case graph::EventKind::Birth: return "birth";
        case graph::EventKind::Death: return "death";
        case graph::EventKind::Marriage: return "marriage";
        default: return "other";
    }
}

static json date_to_json(const graph::NormalizedDate& d) {
    json j;
    j["original"] = d.original;
    j["fidelity"] = graph::fidelity_str(d.fidelity);
    const std::string iso = d.iso();
    if (!iso.empty()) j["iso"] = iso;
    if (!d.qualifier.empty()) j["qualifier"] = d.qualifier;
    return j;
}

static json event_to_json(const graph::Event& e) {
    json j;
    j["kind"] = event_kind_str(e.kind);
    j["tag"] = e.tag;
    if (e.date) j["date"] = date_to_json(*e.date);
    if (e.place) j["place"] = *e.place;
    return j;
}

static json events_to_json(const std::vector<graph::Event>& events) {
    json arr = json::array();
    for (const auto& e : events) arr.push_back(event_to_json(e));
    return arr;
}

json graph_to_json(const graph::Graph& g) {
    json inds = json::array();
    for (const auto& ind : g.individuals()) {
        json names = json::array();
        for (const auto& n : ind.names) {
            names.push_back({
                {"raw", n.raw},
                {"parts", n.parts()},
                {"structured", n.structured}
            });
        }

        json j;
        j["id"] = ind.id;
        j["display_name"] = ind.display_name();
        j["names"] = names;
        j["sex"] = graph::sex_str(ind.sex);
        j["events"] = events_to_json(ind.events);
        j["occupations"] = ind.occupations;
        j["notes"] = ind.notes;
        j["families_as_child"] = ind.families_as_child;
        j["families_as_spouse"] = ind.families_as_spouse;
        inds.push_back(j);
    }

    json fams = json::array();
    for (const auto& fam : g.families()) {
        json j;
        j["id"] = fam.id;
        j["spouse_ids"] = fam.spouse_ids;
        j["child_ids"] = fam.child_ids;
        j["events"] = events_to_json(fam.events);
        fams.push_back(j);
    }

    json out;
    out["individuals"] = inds;
    out["families"] = fams;
    return out;
}
