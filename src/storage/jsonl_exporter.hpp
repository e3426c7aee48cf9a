#pragma once
#include <filesystem>
#include <string>
#include "../core/types/constants.hpp"
#include "exporter.hpp"

namespace Spinner {
namespace Storage {

// Writes one JSON object per line to <output_dir>/<filename>, creating both on demand.
class JsonlExporter : public Exporter {
public:
    explicit JsonlExporter(const std::string& output_dir,
                           const std::string& filename = Core::Constants::DEFAULT_OUTPUT_FILE);
    ~JsonlExporter() override = default;

    void append(const Core::Document& document) override;
    void append_batch(const std::vector<Core::Document>& documents) override;

    // Overwrites <output_dir>/<filename> with a pretty-printed JSON array.
    void write_json_array(const std::vector<Core::Document>& documents,
                          const std::string&                 filename) const;

    const std::filesystem::path& output_dir() const;
    std::filesystem::path        file_path() const;
    bool                         dir_exists() const;
    void                         clear_output_dir() const;

private:
    std::filesystem::path output_dir_;
    std::string           filename_;

    void ensure_output_dir() const;
};

}  // namespace Storage
}  // namespace Spinner
