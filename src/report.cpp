#include "cpgslice/report.hpp"

#include "internal/files.hpp"
#include "internal/types.hpp"

#include <glaze/glaze.hpp>

#include <utility>

namespace cpgslice::report {

    report_document make_report_document(
            const verify::verification_report& report, std::map<std::string, std::string, std::less<>> files) {
        report_document doc{};
        doc.files = std::move(files);
        doc.counts = report.counts;
        for (const auto& [category, result] : report.categories) {
            doc.verification_results.emplace(category, result);
        }
        doc.overall_passed = report.overall_passed();
        return doc;
    }

    std::string to_json(const report_document& doc) {
        return internal::to_pretty_json(doc);
    }

    std::optional<report_document> parse_report_json(std::string_view json) {
        report_document doc{};
        std::string buffer{json};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(doc, buffer);
        if (ec) {
            debug_log("rejected report json: ", glz::format_error(ec, buffer));
            return std::nullopt;
        }
        return doc;
    }

    void write_report_file(const report_document& doc, const std::filesystem::path& path) {
        internal::write_json_file(doc, path);
    }

}  // namespace cpgslice::report
