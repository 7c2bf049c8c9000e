/**
 * @file global_integrator.cpp
 * @brief Document-at-a-time integration into the global store.
 */

#include <integration/global_integrator.hpp>
#include <integration/attribute_merger.hpp>
#include <integration/identity_assigner.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <cstdio>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace Broadsheet {

static std::string join_keys(const AttributeMerger::ChangedKeys& keys) {
    std::string out;
    for (size_t i = 0; i < keys.size(); ++i) {
        if (i) out += ", ";
        out += keys[i];
    }
    return out;
}

static std::string percent(size_t part, size_t total) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f%%", 100.0 * static_cast<double>(part) / static_cast<double>(total));
    return buf;
}

GlobalIntegrator::GlobalIntegrator(GraphStore& store, const IntegrationConfig& config)
    : store_(store), config_(config), matcher_(config), resolver_(store) {}

void GlobalIntegrator::merge_into(GlobalEntity& target, const std::string& document_id,
                                  const CandidateEntity& candidate) {
    add_source(target.sources, document_id);
    AttributeMerger::merge_core(target, candidate.entity);

    AttributeMerger::ChangedKeys changed;
    AttributeMerger::ChangedKeys* trace = Logger::debug_enabled() ? &changed : nullptr;
    if (target.type == EntityType::Location && candidate.location) {
        AttributeMerger::merge_location(target.location, *candidate.location, trace);
    } else if (target.type == EntityType::Time && candidate.time) {
        AttributeMerger::merge_time(target.time, *candidate.time, trace);
    }
    if (!changed.empty()) {
        Logger::debug("Updated attributes of " + target.id + ": " + join_keys(changed));
    }
}

std::string GlobalIntegrator::integrate_entity(const std::string& document_id, const CandidateEntity& candidate,
                                               IntegrationStats& stats) {
    const LocalEntity& local = candidate.entity;
    const EntityView view = candidate.view();

    if (auto match = matcher_.find_match(store_, view)) {
        GlobalEntity& target = store_.entity_at(*match);
        merge_into(target, document_id, candidate);
        ++stats.entities_merged;
        Logger::debug("Matched entity: " + local.text + " (" + std::string(local.type_name()) + ") with global ID " + target.id);
        return target.id;
    }

    std::string id = IdentityAssigner::assign(view);

    // Same signature as a stored entity that the matcher did not consider similar
    if (GlobalEntity* existing = store_.find_entity(id)) {
        merge_into(*existing, document_id, candidate);
        ++stats.entities_merged;
        Logger::debug("Merged entity on identical signature: " + local.text + " (" + std::string(local.type_name()) +
                      ") into global ID " + id);
        return id;
    }

    GlobalEntity entity;
    entity.id = id;
    entity.type = local.type;
    entity.text = local.text;
    entity.normalized = local.normalized;
    entity.confidence = local.confidence;
    entity.other_type = local.other_type;
    entity.sources.push_back(document_id);
    if (local.type == EntityType::Location && candidate.location) entity.location = *candidate.location;
    if (local.type == EntityType::Time && candidate.time) entity.time = *candidate.time;

    store_.add_entity(std::move(entity));
    ++stats.entities_created;
    Logger::debug("Created new entity: " + local.text + " (" + std::string(local.type_name()) + ") with global ID " + id);
    return id;
}

IntegrationStats GlobalIntegrator::integrate_document(const DocumentRecord& document) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finalized_) {
        throw std::logic_error("integrate_document called after finalize (document " + document.id + ")");
    }

    Logger::debug("Integrating document: " + document.id + " (" +
                  std::to_string(document.entities.size()) + " entities, " +
                  std::to_string(document.relations.size()) + " relations, " +
                  std::to_string(document.locations.size()) + " locations, " +
                  std::to_string(document.timeperiods.size()) + " timeperiods)");

    // Later rows for the same entity id win
    std::unordered_map<std::string, const LocationAttributes*> location_rows;
    for (const auto& row : document.locations) location_rows[row.entity_id] = &row.attributes;
    std::unordered_map<std::string, const TimeAttributes*> time_rows;
    for (const auto& row : document.timeperiods) time_rows[row.entity_id] = &row.attributes;

    IntegrationStats stats;
    IdMap id_map;

    for (const auto& local : document.entities) {
        CandidateEntity candidate{local, nullptr, nullptr};
        if (local.type == EntityType::Location) {
            auto it = location_rows.find(local.id);
            if (it != location_rows.end()) candidate.location = it->second;
        } else if (local.type == EntityType::Time) {
            auto it = time_rows.find(local.id);
            if (it != time_rows.end()) candidate.time = it->second;
        }
        id_map[local.id] = integrate_entity(document.id, candidate, stats);
    }

    for (const auto& relation : document.relations) {
        switch (resolver_.integrate(document.id, relation, id_map)) {
            case RelationOutcome::Added:
                ++stats.relations_added;
                break;
            case RelationOutcome::Merged:
                ++stats.relations_merged;
                Logger::debug("Found duplicate relation: " + relation.predicate);
                break;
            case RelationOutcome::Dropped:
                ++stats.relations_dropped;
                Logger::debug("Skipping relation " + relation.predicate + ": missing entity mapping for " +
                              relation.subject + " or " + relation.object);
                break;
        }
    }

    Logger::debug("Added " + std::to_string(stats.relations_added) + " new relations");
    return stats;
}

BatchSummary GlobalIntegrator::integrate_batch(const std::vector<LoadResult>& files) {
    Timer timer;
    BatchSummary summary;
    summary.files_total = files.size();

    for (size_t i = 0; i < files.size(); ++i) {
        const LoadResult& file = files[i];
        Logger::step("[" + std::to_string(i + 1) + "/" + std::to_string(files.size()) + "] Integrating " +
                     file.path.string());

        if (!file.ok) {
            ++summary.files_failed;
            Logger::warn("Error processing file " + file.path.string() + ": " + file.error +
                         " (continuing with next file)");
            continue;
        }

        if (file.stats.total() > 0) {
            Logger::warn(file.path.filename().string() + ": skipped " +
                         std::to_string(file.stats.entities_skipped) + " entities, " +
                         std::to_string(file.stats.relations_skipped) + " relations, " +
                         std::to_string(file.stats.attribute_rows_skipped) + " attribute rows (malformed)");
        }
        summary.records_skipped += file.stats;

        for (const auto& document : file.documents) {
            summary.stats += integrate_document(document);
            ++summary.documents;
        }

        Logger::info(std::to_string(file.documents.size()) + " documents processed from this file; running total: " +
                     std::to_string(store_.entity_count()) + " unique entities, " +
                     std::to_string(store_.relation_count()) + " unique relations");
    }

    summary.elapsed_ms = timer.elapsed_ms();
    return summary;
}

const GraphStore& GlobalIntegrator::finalize() {
    std::lock_guard<std::mutex> lock(mutex_);
    finalized_ = true;
    return store_;
}

bool GlobalIntegrator::finalized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finalized_;
}

ValidationReport GlobalIntegrator::validate() const {
    std::lock_guard<std::mutex> lock(mutex_);

    ValidationReport report;
    report.total_entities = store_.entity_count();
    report.total_relations = store_.relation_count();

    for (const auto& e : store_.entities()) {
        ++report.entities_by_type[std::string(e.type_name())];
        if (e.type == EntityType::Location) {
            if (e.location.has_coordinates()) ++report.location_with_coords;
            else ++report.location_without_coords;
        } else if (e.type == EntityType::Time) {
            if (e.time.has_start_date()) ++report.time_with_dates;
            else ++report.time_without_dates;
        }
    }

    for (const auto& r : store_.relations()) {
        if (r.context_time) ++report.relations_with_time;
        if (r.context_location) ++report.relations_with_location;
    }
    return report;
}

// ============================================================================
// ValidationReport
// ============================================================================

size_t ValidationReport::count_of(EntityType type) const {
    auto it = entities_by_type.find(to_string(type));
    return it == entities_by_type.end() ? 0 : it->second;
}

void ValidationReport::print() const {
    Logger::info("Entity Integration Validation");
    Logger::info("Total unique entities: " + std::to_string(total_entities));
    Logger::info("Total relations: " + std::to_string(total_relations));

    Logger::info("Entity types:");
    for (const auto& [type, count] : entities_by_type) {
        Logger::info("  " + type + ": " + std::to_string(count));
    }

    const size_t locations = count_of(EntityType::Location);
    if (locations > 0) {
        Logger::info("Location entities:");
        Logger::info("  With coordinates: " + std::to_string(location_with_coords) + " (" +
                     percent(location_with_coords, locations) + ")");
        Logger::info("  Without coordinates: " + std::to_string(location_without_coords) + " (" +
                     percent(location_without_coords, locations) + ")");
    }

    const size_t times = count_of(EntityType::Time);
    if (times > 0) {
        Logger::info("Time entities:");
        Logger::info("  With date information: " + std::to_string(time_with_dates) + " (" +
                     percent(time_with_dates, times) + ")");
        Logger::info("  Without date information: " + std::to_string(time_without_dates) + " (" +
                     percent(time_without_dates, times) + ")");
    }

    if (total_relations > 0) {
        Logger::info("Relation contexts:");
        Logger::info("  With time context: " + std::to_string(relations_with_time) + " (" +
                     percent(relations_with_time, total_relations) + ")");
        Logger::info("  With location context: " + std::to_string(relations_with_location) + " (" +
                     percent(relations_with_location, total_relations) + ")");
    }
}

nlohmann::ordered_json ValidationReport::to_json() const {
    nlohmann::ordered_json j;
    j["total_entities"] = total_entities;
    j["total_relations"] = total_relations;
    j["entities_by_type"] = nlohmann::ordered_json::object();
    for (const auto& [type, count] : entities_by_type) {
        j["entities_by_type"][type] = count;
    }
    j["location_with_coords"] = location_with_coords;
    j["location_without_coords"] = location_without_coords;
    j["time_with_dates"] = time_with_dates;
    j["time_without_dates"] = time_without_dates;
    j["relations_with_time"] = relations_with_time;
    j["relations_with_location"] = relations_with_location;
    return j;
}

} // namespace Broadsheet
