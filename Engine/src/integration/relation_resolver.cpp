#include <integration/relation_resolver.hpp>
#include <integration/identity_assigner.hpp>
#include <storage/graph_store.hpp>
#include <algorithm>
#include <utility>

namespace Broadsheet {

static const std::string* resolve(const IdMap& id_map, const std::string& local_id) {
    auto it = id_map.find(local_id);
    return it == id_map.end() ? nullptr : &it->second;
}

std::string RelationResolver::signature(const std::string& subject, const std::string& predicate,
                                        const std::string& object,
                                        const std::string* context_time, const std::string* context_location) {
    std::string sig = subject + "_" + predicate + "_" + object;
    if (context_time) sig += "_time_" + *context_time;
    if (context_location) sig += "_loc_" + *context_location;
    return sig;
}

std::string RelationResolver::signature(const GlobalRelation& relation) {
    return signature(relation.subject, relation.predicate, relation.object,
                     relation.context_time ? &*relation.context_time : nullptr,
                     relation.context_location ? &*relation.context_location : nullptr);
}

RelationOutcome RelationResolver::integrate(const std::string& document_id, const LocalRelation& relation,
                                            const IdMap& id_map) {
    const std::string* subject = resolve(id_map, relation.subject);
    const std::string* object = resolve(id_map, relation.object);
    if (!subject || !object) return RelationOutcome::Dropped;

    const std::string* ctx_time = relation.context_time ? resolve(id_map, *relation.context_time) : nullptr;
    const std::string* ctx_loc = relation.context_location ? resolve(id_map, *relation.context_location) : nullptr;

    const std::string sig = signature(*subject, relation.predicate, *object, ctx_time, ctx_loc);

    if (GlobalRelation* existing = store_.find_relation(sig)) {
        existing->confidence = std::max(existing->confidence, relation.confidence);
        add_source(existing->sources, document_id);
        return RelationOutcome::Merged;
    }

    GlobalRelation rec;
    rec.id = IdentityAssigner::relation_id(sig);
    rec.subject = *subject;
    rec.predicate = relation.predicate;
    rec.object = *object;
    rec.confidence = relation.confidence;
    if (ctx_time) rec.context_time = *ctx_time;
    if (ctx_loc) rec.context_location = *ctx_loc;
    rec.sources.push_back(document_id);

    store_.add_relation(sig, std::move(rec));
    return RelationOutcome::Added;
}

} // namespace Broadsheet
