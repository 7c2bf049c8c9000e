/**
 * @file document_loader.hpp
 * @brief Reads per-document extraction files into DocumentRecords
 *
 * A file holds either one document ({"entities": ..., "relations": ...,
 * "locations": ..., "timeperiods": ...}) or an object mapping document keys to such
 * objects. Document ids are the file stem, or "<stem>_<key>" for multi-document files.
 *
 * Parsing is pure, so files can be parsed in parallel; results keep input order.
 */

#pragma once

#include <model/document.hpp>
#include <export.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace Broadsheet {

/**
 * @brief Records dropped while parsing a file (malformed, not fatal)
 */
struct DocumentLoadStats {
    size_t entities_skipped = 0;
    size_t relations_skipped = 0;
    size_t attribute_rows_skipped = 0;

    DocumentLoadStats& operator+=(const DocumentLoadStats& o) {
        entities_skipped += o.entities_skipped;
        relations_skipped += o.relations_skipped;
        attribute_rows_skipped += o.attribute_rows_skipped;
        return *this;
    }
    size_t total() const { return entities_skipped + relations_skipped + attribute_rows_skipped; }
};

/**
 * @brief Outcome of loading one file. ok=false means the whole file is skipped.
 */
struct LoadResult {
    std::filesystem::path path;
    bool ok = false;
    std::string error;
    std::vector<DocumentRecord> documents;
    DocumentLoadStats stats;
};

class BROADSHEET_API DocumentLoader {
public:
    using Json = nlohmann::ordered_json;

    /**
     * @brief *.json files directly inside @p dir, sorted by file name.
     * @throws std::runtime_error if dir is not a readable directory
     */
    static std::vector<std::filesystem::path> list_inputs(const std::filesystem::path& dir);

    /**
     * @brief Read and parse one file. Never throws; failures come back as ok=false.
     */
    static LoadResult load_file(const std::filesystem::path& path);

    /**
     * @brief Load many files on up to @p threads workers. result[i] belongs to paths[i].
     */
    static std::vector<LoadResult> load_batch(const std::vector<std::filesystem::path>& paths, size_t threads);

    /**
     * @brief Split a parsed file into documents (single or multi-document layout).
     * @throws std::invalid_argument if root is not a JSON object
     */
    static std::vector<DocumentRecord> split_documents(const std::string& stem, const Json& root,
                                                       DocumentLoadStats& stats);

    /**
     * @brief Build one document from its JSON object. Malformed records are skipped and counted.
     */
    static DocumentRecord parse_document(const std::string& id, const Json& obj, DocumentLoadStats& stats);

    // True for the {"<key>": {...}, ...} layout: every value an object, no top-level "entities"
    static bool is_multi_document(const Json& root);
};

} // namespace Broadsheet
