/**
 * @file document_loader.cpp
 * @brief JSON extraction file parsing with defensive field checks.
 */

#include <ingestion/document_loader.hpp>
#include <storage/format_utils.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <thread>

namespace Broadsheet {

namespace fs = std::filesystem;
using Json = DocumentLoader::Json;

namespace {

// Ids and codes arrive as strings or integers depending on the upstream extractor.
std::optional<std::string> optional_string(const Json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer()) return std::to_string(it->get<long long>());
    if (it->is_number_unsigned()) return std::to_string(it->get<unsigned long long>());
    if (it->is_number_float()) return format_double(it->get<double>());
    return std::nullopt;
}

std::optional<double> optional_number(const Json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    if (it->is_number()) return it->get<double>();
    if (it->is_string()) {
        const auto& s = it->get_ref<const std::string&>();
        const char* begin = s.c_str();
        char* end = nullptr;
        double v = std::strtod(begin, &end);
        if (!s.empty() && end == begin + s.size()) return v;
    }
    return std::nullopt;
}

const Json* optional_array(const Json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_array()) return nullptr;
    return &*it;
}

bool parse_entity(const Json& j, LocalEntity& out) {
    if (!j.is_object()) return false;
    auto id = optional_string(j, "id");
    auto type_name = optional_string(j, "type");
    auto text = optional_string(j, "text");
    if (!id || !type_name || type_name->empty() || !text) return false;

    out.id = std::move(*id);
    if (auto type = parse_entity_type(*type_name)) {
        out.type = *type;
        out.other_type.clear();
    } else {
        out.type = EntityType::Other;
        out.other_type = std::move(*type_name);
    }
    out.text = std::move(*text);
    out.normalized = optional_string(j, "normalized");
    out.confidence = optional_number(j, "confidence").value_or(0.0);
    return true;
}

bool parse_relation(const Json& j, LocalRelation& out) {
    if (!j.is_object()) return false;
    auto subject = optional_string(j, "subject");
    auto predicate = optional_string(j, "predicate");
    auto object = optional_string(j, "object");
    if (!subject || !predicate || !object) return false;

    out.subject = std::move(*subject);
    out.predicate = std::move(*predicate);
    out.object = std::move(*object);
    out.confidence = optional_number(j, "confidence").value_or(0.0);
    out.context_time = optional_string(j, "context_time");
    out.context_location = optional_string(j, "context_location");
    return true;
}

bool parse_location(const Json& j, LocationRow& out) {
    if (!j.is_object()) return false;
    auto entity_id = optional_string(j, "entity_id");
    if (!entity_id) return false;

    out.entity_id = std::move(*entity_id);
    auto& a = out.attributes;
    a.latitude = optional_number(j, "latitude");
    a.longitude = optional_number(j, "longitude");
    a.display_name = optional_string(j, "display_name");
    a.location_type = optional_string(j, "location_type");
    a.importance = optional_number(j, "importance");
    a.osm_id = optional_string(j, "osm_id");
    a.bbox_south = optional_number(j, "bbox_south");
    a.bbox_north = optional_number(j, "bbox_north");
    a.bbox_west = optional_number(j, "bbox_west");
    a.bbox_east = optional_number(j, "bbox_east");
    return true;
}

bool parse_timeperiod(const Json& j, TimeRow& out) {
    if (!j.is_object()) return false;
    auto entity_id = optional_string(j, "entity_id");
    if (!entity_id) return false;

    out.entity_id = std::move(*entity_id);
    auto& a = out.attributes;
    if (auto p = optional_string(j, "precision")) a.precision = parse_time_precision(*p);
    if (auto k = optional_string(j, "type")) a.kind = parse_time_kind(*k);
    a.start_date = optional_string(j, "start_date");
    a.end_date = optional_string(j, "end_date");
    a.date_reliability = optional_number(j, "date_reliability");
    return true;
}

} // namespace

std::vector<fs::path> DocumentLoader::list_inputs(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw std::runtime_error("Input directory not found: " + dir.string());
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });
    return files;
}

bool DocumentLoader::is_multi_document(const Json& root) {
    if (!root.is_object() || root.contains("entities")) return false;
    return std::all_of(root.begin(), root.end(), [](const Json& v) { return v.is_object(); });
}

DocumentRecord DocumentLoader::parse_document(const std::string& id, const Json& obj, DocumentLoadStats& stats) {
    DocumentRecord doc;
    doc.id = id;

    if (const Json* arr = optional_array(obj, "entities")) {
        doc.entities.reserve(arr->size());
        for (const auto& j : *arr) {
            LocalEntity e;
            if (parse_entity(j, e)) {
                doc.entities.push_back(std::move(e));
            } else {
                ++stats.entities_skipped;
                if (Logger::debug_enabled()) Logger::debug(id + ": skipping malformed entity " + j.dump());
            }
        }
    }

    if (const Json* arr = optional_array(obj, "relations")) {
        doc.relations.reserve(arr->size());
        for (const auto& j : *arr) {
            LocalRelation r;
            if (parse_relation(j, r)) {
                doc.relations.push_back(std::move(r));
            } else {
                ++stats.relations_skipped;
                if (Logger::debug_enabled()) Logger::debug(id + ": skipping malformed relation " + j.dump());
            }
        }
    }

    if (const Json* arr = optional_array(obj, "locations")) {
        for (const auto& j : *arr) {
            LocationRow row;
            if (parse_location(j, row)) {
                doc.locations.push_back(std::move(row));
            } else {
                ++stats.attribute_rows_skipped;
                Logger::debug(id + ": skipping location row without entity_id");
            }
        }
    }

    if (const Json* arr = optional_array(obj, "timeperiods")) {
        for (const auto& j : *arr) {
            TimeRow row;
            if (parse_timeperiod(j, row)) {
                doc.timeperiods.push_back(std::move(row));
            } else {
                ++stats.attribute_rows_skipped;
                Logger::debug(id + ": skipping timeperiod row without entity_id");
            }
        }
    }

    return doc;
}

std::vector<DocumentRecord> DocumentLoader::split_documents(const std::string& stem, const Json& root,
                                                            DocumentLoadStats& stats) {
    if (!root.is_object()) {
        throw std::invalid_argument("top-level JSON value is not an object");
    }

    std::vector<DocumentRecord> docs;
    if (is_multi_document(root)) {
        docs.reserve(root.size());
        for (const auto& [key, value] : root.items()) {
            docs.push_back(parse_document(stem + "_" + key, value, stats));
        }
    } else {
        docs.push_back(parse_document(stem, root, stats));
    }
    return docs;
}

LoadResult DocumentLoader::load_file(const fs::path& path) {
    LoadResult result;
    result.path = path;

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        result.error = "cannot open file";
        return result;
    }

    try {
        Json root = Json::parse(file);
        result.documents = split_documents(path.stem().string(), root, result.stats);
        result.ok = true;
    } catch (const nlohmann::json::exception& e) {
        result.error = e.what();
    } catch (const std::invalid_argument& e) {
        result.error = e.what();
    }
    return result;
}

std::vector<LoadResult> DocumentLoader::load_batch(const std::vector<fs::path>& paths, size_t threads) {
    std::vector<LoadResult> results(paths.size());

    const size_t num_threads = std::min(std::max<size_t>(threads, 1), paths.size());

    if (num_threads <= 1) {
        for (size_t i = 0; i < paths.size(); ++i) {
            results[i] = load_file(paths[i]);
        }
        return results;
    }

    std::vector<std::thread> workers;
    size_t chunk_size = (paths.size() + num_threads - 1) / num_threads;

    for (size_t t = 0; t < num_threads; ++t) {
        size_t start = t * chunk_size;
        size_t end = std::min(start + chunk_size, paths.size());
        if (start >= end) break;

        workers.emplace_back([&paths, &results, start, end]() {
            for (size_t i = start; i < end; ++i) {
                results[i] = load_file(paths[i]);
            }
        });
    }

    for (auto& worker : workers) {
        worker.join();
    }

    return results;
}

} // namespace Broadsheet
