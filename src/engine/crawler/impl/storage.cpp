#include "../../../core/logger/logger.hpp"
#include "../../../utils/html/metadata.hpp"
#include "../../../utils/text/converter.hpp"
#include "../crawler.hpp"

namespace Spinner {
namespace Engine {

using Spinner::Core::Document;
using Spinner::Core::Logger;
using Spinner::Utils::Text::Converter;

Document Crawler::build_document() const {
    const std::string& html     = current_response_.body;
    auto               metadata = Utils::Html::extract_metadata(html);

    Document document;
    document.url         = current_url_;
    document.title       = metadata.title.value_or("");
    document.description = metadata.description;
    document.content     = Converter::to_markdown(html);
    document.links       = current_links_;
    document.metadata    = metadata.other;
    if (metadata.keywords)
        document.metadata["keywords"] = *metadata.keywords;
    if (metadata.author)
        document.metadata["author"] = *metadata.author;
    if (config_.include_raw_html)
        document.raw_html = html;
    return document;
}

void Crawler::export_document(const Document& document) {
    if (!exporter_)
        return;

    try {
        exporter_->append(document);
    } catch (const Storage::ExportError& e) {
        Logger::warn("Export failed for " + document.url + ": " + e.what());
    }
}

void Crawler::record_page() {
    Document document = build_document();
    export_document(document);

    stats_.pages_crawled++;
    Logger::success("Crawled: " + document.url + " (" + std::to_string(document.link_count())
                    + " links)");

    documents_.push_back(std::move(document));
    current_response_ = Response{};
    current_links_.clear();
}

}  // namespace Engine
}  // namespace Spinner
