#include "redline/richtext/delta.h"
#include "redline/core/logging.h"
#include "redline/core/string_utils.h"

#include <nlohmann/json.hpp>

#include <cstddef>

namespace redline::richtext {

using Json = nlohmann::json;

namespace {

DeltaError parseAttributes(const Json& attrs, AttributeMap& out) {
    if (!attrs.is_object()) return DeltaError::InvalidAttribute;
    for (auto it = attrs.begin(); it != attrs.end(); ++it) {
        const Json& v = it.value();
        if (v.is_boolean()) {
            out.emplace(it.key(), v.get<bool>());
        } else if (v.is_number_integer()) {
            out.emplace(it.key(), v.get<std::int64_t>());
        } else if (v.is_string()) {
            out.emplace(it.key(), v.get<std::string>());
        } else {
            return DeltaError::InvalidAttribute;
        }
    }
    return DeltaError::Ok;
}

Json attributesToJson(const AttributeMap& attrs) {
    Json obj = Json::object();
    for (const auto& [key, value] : attrs) {
        if (const bool* b = std::get_if<bool>(&value)) {
            obj[key] = *b;
        } else if (const std::int64_t* i = std::get_if<std::int64_t>(&value)) {
            obj[key] = *i;
        } else {
            obj[key] = std::get<std::string>(value);
        }
    }
    return obj;
}

} // namespace

const char* toString(DeltaError error) {
    switch (error) {
        case DeltaError::Ok: return "ok";
        case DeltaError::MalformedJson: return "malformed json";
        case DeltaError::NotAnOpsList: return "not an ops list";
        case DeltaError::UnsupportedOperation: return "unsupported operation";
        case DeltaError::InvalidInsert: return "invalid insert";
        case DeltaError::InvalidAttribute: return "invalid attribute";
    }
    return "unknown";
}

const char* toString(CorrectionStatus status) {
    switch (status) {
        case CorrectionStatus::Ok: return "ok";
        case CorrectionStatus::NotFound: return "not found";
        case CorrectionStatus::MultiRunSpan: return "multi-run span";
        case CorrectionStatus::EmbedInSpan: return "embed in span";
    }
    return "unknown";
}

DeltaError parseDelta(std::string_view json, RichTextDelta& out) {
    out = RichTextDelta{};
    const Json doc = Json::parse(json.begin(), json.end(), nullptr, false);
    if (doc.is_discarded()) return DeltaError::MalformedJson;

    const Json* ops = nullptr;
    DeltaEnvelope envelope = DeltaEnvelope::OpsObject;
    if (doc.is_array()) {
        ops = &doc;
        envelope = DeltaEnvelope::BareArray;
    } else if (doc.is_object()) {
        auto it = doc.find("ops");
        if (it == doc.end() || !it->is_array()) return DeltaError::NotAnOpsList;
        ops = &*it;
    } else {
        return DeltaError::NotAnOpsList;
    }

    RichTextDelta delta;
    delta.envelope = envelope;
    delta.runs.reserve(ops->size());
    for (const Json& op : *ops) {
        if (!op.is_object()) return DeltaError::NotAnOpsList;
        if (op.contains("retain") || op.contains("delete")) return DeltaError::UnsupportedOperation;
        auto insert = op.find("insert");
        if (insert == op.end()) return DeltaError::UnsupportedOperation;

        RichTextRun run;
        if (insert->is_string()) {
            run.text = insert->get<std::string>();
        } else if (insert->is_object()) {
            run.embed = insert->dump();
        } else {
            return DeltaError::InvalidInsert;
        }

        auto attrs = op.find("attributes");
        if (attrs != op.end()) {
            const DeltaError err = parseAttributes(*attrs, run.attributes);
            if (err != DeltaError::Ok) return err;
        }
        delta.runs.push_back(std::move(run));
    }

    out = std::move(delta);
    return DeltaError::Ok;
}

std::string serializeDelta(const RichTextDelta& delta) {
    Json ops = Json::array();
    for (const auto& run : delta.runs) {
        Json op = Json::object();
        if (run.embed) {
            Json embed = Json::parse(*run.embed, nullptr, false);
            op["insert"] = embed.is_discarded() ? Json::object() : embed;
        } else {
            op["insert"] = run.text;
        }
        if (!run.attributes.empty()) {
            op["attributes"] = attributesToJson(run.attributes);
        }
        ops.push_back(std::move(op));
    }
    if (delta.envelope == DeltaEnvelope::BareArray) {
        return ops.dump();
    }
    Json doc = Json::object();
    doc["ops"] = std::move(ops);
    return doc.dump();
}

std::string plainText(const RichTextDelta& delta) {
    std::string text;
    for (const auto& run : delta.runs) {
        if (!run.isEmbed()) text += run.text;
    }
    return text;
}

CorrectionResult applyCorrection(
    const RichTextDelta& delta,
    std::string_view errorText,
    std::string_view suggestion,
    std::optional<std::uint32_t> expectedOffset) {
    CorrectionResult result;
    if (errorText.empty()) return result;

    const std::string plain = plainText(delta);
    std::size_t matchStart = std::string::npos;
    if (expectedOffset) {
        const std::size_t b = logicalToByteIndex(plain, *expectedOffset);
        if (byteToLogicalIndex(plain, b) == *expectedOffset
            && plain.compare(b, errorText.size(), errorText) == 0) {
            matchStart = b;
        }
    } else {
        matchStart = plain.find(errorText);
    }
    if (matchStart == std::string::npos) return result;
    const std::size_t matchEnd = matchStart + errorText.size();

    // Byte extents of each text run within plain.
    std::size_t runStart = 0;
    for (std::size_t i = 0; i < delta.runs.size(); ++i) {
        const RichTextRun& run = delta.runs[i];
        if (run.isEmbed()) continue;
        const std::size_t runEnd = runStart + run.text.size();
        if (runStart <= matchStart && matchEnd <= runEnd && matchStart < runEnd) {
            result.delta = delta;
            std::string& target = result.delta.runs[i].text;
            target.replace(matchStart - runStart, errorText.size(), suggestion);
            if (target.empty()) {
                result.delta.runs.erase(result.delta.runs.begin() + static_cast<std::ptrdiff_t>(i));
            }
            result.status = CorrectionStatus::Ok;
            return result;
        }
        if (matchStart < runEnd) break;
        runStart = runEnd;
    }

    // An embed between two text runs is invisible in plain but would be
    // destroyed by rewriting across it.
    runStart = 0;
    for (const RichTextRun& run : delta.runs) {
        if (run.isEmbed() && matchStart < runStart && runStart < matchEnd) {
            result.status = CorrectionStatus::EmbedInSpan;
            return result;
        }
        runStart += run.text.size();
    }

    REDLINE_LOG_DEBUG("correction of %zu bytes crosses a run boundary", errorText.size());
    result.status = CorrectionStatus::MultiRunSpan;
    return result;
}

RichTextDelta normalize(const RichTextDelta& delta) {
    RichTextDelta out;
    out.envelope = delta.envelope;
    for (const auto& run : delta.runs) {
        if (!out.runs.empty()) {
            RichTextRun& last = out.runs.back();
            if (!last.isEmbed() && !run.isEmbed() && last.attributes == run.attributes) {
                last.text += run.text;
                continue;
            }
        }
        out.runs.push_back(run);
    }
    return out;
}

} // namespace redline::richtext
