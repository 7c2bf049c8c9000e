#pragma once

#include <export.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace Broadsheet {

/**
 * @brief Streams rows into one CSV file per table under a directory.
 *
 * Usage:
 *   TableWriter tw(dir);
 *   tw.begin_table("entities", {"id","type",...});
 *   for (...) tw.add_row({...});
 *   tw.flush(); // or rely on destructor to flush as a best-effort
 *
 * Notes:
 * - begin_table must be called before add_row. It truncates <dir>/<name>.csv and writes the header.
 * - Values are quoted only when they contain a delimiter, quote or line break.
 * - This class is not thread-safe; use one instance per output directory/thread.
 */
class BROADSHEET_API TableWriter {
public:
    explicit TableWriter(std::filesystem::path dir);
    ~TableWriter();

    TableWriter(const TableWriter&) = delete;
    TableWriter& operator=(const TableWriter&) = delete;

    // Open <dir>/<name>.csv, creating dir if needed. Flushes any previous table first.
    void begin_table(const std::string& name, const std::vector<std::string>& columns);

    // Add a row. values.size() may be <= columns.size(); missing values become empty fields.
    void add_row(const std::vector<std::string>& values);

    // Write buffered rows and close the current file.
    void flush();

    // Number of rows added since begin_table (resets after flush)
    size_t count() const noexcept { return row_count_; }

    // Path of the file for @p name
    std::filesystem::path table_path(const std::string& name) const;

private:
    void write_buffer();
    void write_record(const std::vector<std::string>& values);
    void escape_value_into_buffer(const std::string& value);

    std::filesystem::path dir_;
    std::filesystem::path current_path_;
    std::ofstream file_;
    std::ostringstream buffer_;
    std::vector<std::string> columns_;
    size_t row_count_ = 0;
    bool in_table_ = false;

    static constexpr size_t DEFAULT_FLUSH_ROWS = 50000;
};

} // namespace Broadsheet
