#include <export/table_writer.hpp>
#include <utils/logger.hpp>
#include <stdexcept>
#include <utility>

namespace Broadsheet {

namespace fs = std::filesystem;

TableWriter::TableWriter(fs::path dir) : dir_(std::move(dir)) {}

TableWriter::~TableWriter() {
    try {
        flush();
    } catch (const std::exception& e) {
        Logger::warn(std::string("TableWriter: final flush failed: ") + e.what());
    }
}

fs::path TableWriter::table_path(const std::string& name) const {
    return dir_ / (name + ".csv");
}

void TableWriter::begin_table(const std::string& name, const std::vector<std::string>& columns) {
    if (in_table_) flush();
    if (columns.empty()) {
        throw std::invalid_argument("TableWriter: table '" + name + "' has no columns");
    }

    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        throw std::runtime_error("TableWriter: cannot create directory " + dir_.string() + ": " + ec.message());
    }

    current_path_ = table_path(name);
    file_.open(current_path_, std::ios::binary | std::ios::trunc);
    if (!file_) {
        throw std::runtime_error("TableWriter: cannot open " + current_path_.string());
    }

    columns_ = columns;
    row_count_ = 0;
    buffer_.str("");
    buffer_.clear();
    in_table_ = true;

    write_record(columns_);
}

void TableWriter::escape_value_into_buffer(const std::string& value) {
    bool needs_quotes = false;
    for (char c : value) {
        if (c == ',' || c == '"' || c == '\n' || c == '\r') {
            needs_quotes = true;
            break;
        }
    }
    if (!needs_quotes) {
        buffer_ << value;
        return;
    }

    buffer_ << '"';
    for (char c : value) {
        if (c == '"') buffer_ << "\"\"";
        else buffer_ << c;
    }
    buffer_ << '"';
}

void TableWriter::write_record(const std::vector<std::string>& values) {
    const size_t ncols = columns_.size();
    for (size_t i = 0; i < ncols; ++i) {
        if (i) buffer_ << ',';
        if (i < values.size()) escape_value_into_buffer(values[i]);
    }
    buffer_ << '\n';
}

void TableWriter::write_buffer() {
    std::string data = buffer_.str();
    if (!data.empty()) {
        file_.write(data.data(), static_cast<std::streamsize>(data.size()));
        if (!file_) {
            throw std::runtime_error("TableWriter: write failed for " + current_path_.string());
        }
    }
    buffer_.str("");
    buffer_.clear();
}

void TableWriter::add_row(const std::vector<std::string>& values) {
    if (!in_table_) {
        throw std::runtime_error("TableWriter: no table open. Call begin_table() first.");
    }
    if (values.size() > columns_.size()) {
        throw std::invalid_argument("TableWriter: row has " + std::to_string(values.size()) +
                                    " values for " + std::to_string(columns_.size()) + " columns");
    }

    write_record(values);
    ++row_count_;

    if ((row_count_ % DEFAULT_FLUSH_ROWS) == 0) {
        write_buffer();
    }
}

void TableWriter::flush() {
    if (!in_table_) return;

    in_table_ = false;
    write_buffer();
    file_.close();
    if (file_.fail()) {
        throw std::runtime_error("TableWriter: close failed for " + current_path_.string());
    }
    row_count_ = 0;
}

} // namespace Broadsheet
