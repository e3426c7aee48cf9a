#include "jsonl_exporter.hpp"
#include <fstream>
#include <vector>
#include <nlohmann/json.hpp>
#include "../core/logger/logger.hpp"

namespace Spinner {
namespace Storage {

namespace fs = std::filesystem;

using Spinner::Core::Document;
using Spinner::Core::Logger;

namespace {

std::ofstream open_for_append(const fs::path& path) {
    std::ofstream file(path, std::ios::out | std::ios::app);
    if (!file.is_open())
        throw ExportError("Cannot open " + path.string() + " for writing");
    return file;
}

void write_line(std::ofstream& file, const Document& document, const fs::path& path) {
    file << document.to_json() << '\n';
    if (!file)
        throw ExportError("Write error: " + path.string());
}

}  // namespace

JsonlExporter::JsonlExporter(const std::string& output_dir, const std::string& filename)
    : output_dir_(output_dir), filename_(filename) {
}

void JsonlExporter::ensure_output_dir() const {
    std::error_code ec;
    fs::create_directories(output_dir_, ec);
    if (ec)
        throw ExportError("Failed to create output directory " + output_dir_.string() + ": "
                          + ec.message());
}

void JsonlExporter::append(const Document& document) {
    ensure_output_dir();

    fs::path      path = file_path();
    std::ofstream file = open_for_append(path);
    write_line(file, document, path);
    Logger::debug("Exported: " + document.url + " -> " + path.string());
}

void JsonlExporter::append_batch(const std::vector<Document>& documents) {
    ensure_output_dir();

    fs::path      path = file_path();
    std::ofstream file = open_for_append(path);
    for (const auto& document : documents)
        write_line(file, document, path);
    Logger::debug("Exported " + std::to_string(documents.size()) + " documents -> " + path.string());
}

void JsonlExporter::write_json_array(const std::vector<Document>& documents,
                                     const std::string&           filename) const {
    ensure_output_dir();

    fs::path      path = output_dir_ / filename;
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open())
        throw ExportError("Cannot open " + path.string() + " for writing");

    nlohmann::json array = documents;
    file << array.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    if (!file)
        throw ExportError("Write error: " + path.string());
    Logger::success("Saved " + std::to_string(documents.size()) + " documents: " + path.string());
}

const fs::path& JsonlExporter::output_dir() const {
    return output_dir_;
}

fs::path JsonlExporter::file_path() const {
    return output_dir_ / filename_;
}

bool JsonlExporter::dir_exists() const {
    std::error_code ec;
    return fs::is_directory(output_dir_, ec);
}

void JsonlExporter::clear_output_dir() const {
    if (!dir_exists())
        return;

    std::error_code       ec;
    std::vector<fs::path> entries;
    for (fs::directory_iterator it(output_dir_, ec), end; !ec && it != end; it.increment(ec))
        entries.push_back(it->path());
    if (ec)
        throw ExportError("Failed to list " + output_dir_.string() + ": " + ec.message());

    for (const auto& entry : entries) {
        fs::remove_all(entry, ec);
        if (ec)
            throw ExportError("Failed to remove " + entry.string() + ": " + ec.message());
    }
}

}  // namespace Storage
}  // namespace Spinner
