/**
 * @file global_integrator.hpp
 * @brief Cross-document entity and relation integration
 *
 * Drives identity assignment, similarity matching, attribute merging and relation
 * resolution over documents in caller order, accumulating everything into a GraphStore.
 *
 * Per document:
 *   1. index the locations/timeperiods rows by local entity id
 *   2. integrate entities in listed order, recording local -> global ids
 *   3. integrate relations in listed order through that id map
 *
 * Matching is first-match-wins in creation order, so the resulting graph depends on
 * document order. Callers integrate in a fixed order (the CLI sorts by file name).
 */

#pragma once

#include <integration/integration_config.hpp>
#include <integration/similarity_matcher.hpp>
#include <integration/relation_resolver.hpp>
#include <ingestion/document_loader.hpp>
#include <model/document.hpp>
#include <storage/graph_store.hpp>
#include <export.hpp>
#include <nlohmann/json.hpp>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace Broadsheet {

/**
 * @brief What one integration call did
 */
struct BROADSHEET_API IntegrationStats {
    size_t entities_created = 0;
    size_t entities_merged = 0;
    size_t relations_added = 0;
    size_t relations_merged = 0;
    size_t relations_dropped = 0;

    IntegrationStats& operator+=(const IntegrationStats& o) {
        entities_created += o.entities_created;
        entities_merged += o.entities_merged;
        relations_added += o.relations_added;
        relations_merged += o.relations_merged;
        relations_dropped += o.relations_dropped;
        return *this;
    }
};

/**
 * @brief Batch-level outcome. partial() is true when any file was skipped.
 */
struct BatchSummary {
    size_t files_total = 0;
    size_t files_failed = 0;
    size_t documents = 0;
    DocumentLoadStats records_skipped;
    IntegrationStats stats;
    double elapsed_ms = 0.0;

    bool partial() const { return files_failed > 0; }
};

/**
 * @brief Data-quality counts over the integrated graph
 */
struct BROADSHEET_API ValidationReport {
    size_t total_entities = 0;
    size_t total_relations = 0;
    std::map<std::string, size_t> entities_by_type;  // type name -> count, sorted by name
    size_t location_with_coords = 0;
    size_t location_without_coords = 0;
    size_t time_with_dates = 0;
    size_t time_without_dates = 0;
    size_t relations_with_time = 0;
    size_t relations_with_location = 0;

    size_t count_of(EntityType type) const;

    // Logs the report, with percentages where the denominator is non-zero
    void print() const;
    nlohmann::ordered_json to_json() const;
};

class BROADSHEET_API GlobalIntegrator {
public:
    explicit GlobalIntegrator(GraphStore& store, const IntegrationConfig& config = IntegrationConfig());

    /**
     * @brief Integrate one document.
     * @throws std::logic_error after finalize()
     */
    IntegrationStats integrate_document(const DocumentRecord& document);

    /**
     * @brief Integrate loaded files in order. Failed loads are logged and skipped.
     */
    BatchSummary integrate_batch(const std::vector<LoadResult>& files);

    /**
     * @brief Close the integrator to further documents and hand back the graph.
     */
    const GraphStore& finalize();
    bool finalized() const;

    /**
     * @brief Count coverage statistics without touching the store.
     */
    ValidationReport validate() const;

    const IntegrationConfig& config() const { return config_; }

private:
    std::string integrate_entity(const std::string& document_id, const CandidateEntity& candidate,
                                 IntegrationStats& stats);
    void merge_into(GlobalEntity& target, const std::string& document_id, const CandidateEntity& candidate);

    GraphStore& store_;
    IntegrationConfig config_;
    SimilarityMatcher matcher_;
    RelationResolver resolver_;
    mutable std::mutex mutex_;  // single writer over store_
    bool finalized_ = false;
};

} // namespace Broadsheet
