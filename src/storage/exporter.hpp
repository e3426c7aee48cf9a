#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include "../core/types/document.hpp"

namespace Spinner {
namespace Storage {

class ExportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Append-only sink for page records. Implementations throw ExportError on failure.
class Exporter {
public:
    virtual ~Exporter() = default;

    virtual void append(const Core::Document& document) = 0;
    virtual void append_batch(const std::vector<Core::Document>& documents) {
        for (const auto& document : documents)
            append(document);
    }
};

}  // namespace Storage
}  // namespace Spinner
