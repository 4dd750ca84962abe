#include "redline/replacement/replacement_executor.h"
#include "redline/codec/pickle.h"
#include "redline/core/logging.h"
#include "redline/core/string_utils.h"
#include "redline/replacement/replacement_validator.h"
#include "redline/richtext/delta.h"
#include "redline/text/grapheme_index.h"

#include <chrono>
#include <exception>
#include <thread>

namespace redline::replacement {

namespace {

FailureKind kindFor(QueryError error, FailureKind otherwise) {
    return error == QueryError::Timeout ? FailureKind::HostUnresponsive : otherwise;
}

std::u16string utf16Of(const char* s) {
    return utf8ToUtf16(std::string_view(s));
}

host::ClipboardItem plainTextItem(const std::string& text) {
    return host::ClipboardItem{codec::kPlainTextType, std::vector<std::uint8_t>(text.begin(), text.end())};
}

} // namespace

ReplacementExecutor::ReplacementExecutor(host::HostSurface& host, const config::HostProfile& profile)
    : host_(host)
    , profile_(profile) {
}

void ReplacementExecutor::settle(std::uint32_t millis) const {
    if (millis > 0) std::this_thread::sleep_for(std::chrono::milliseconds(millis));
}

ReplacementOutcome ReplacementExecutor::execute(const ReplacementContext& context) {
    try {
        return run(context);
    } catch (const std::exception& e) {
        REDLINE_LOG_WARN("host threw during replacement: %s", e.what());
        return ReplacementOutcome::failure(FailureKind::HostUnresponsive, std::string("host threw: ") + e.what());
    }
}

ReplacementOutcome ReplacementExecutor::run(const ReplacementContext& context) {
    if (auto failure = ReplacementValidator::validate(context, host_)) {
        return ReplacementOutcome::failure(failure->kind, failure->detail);
    }

    const auto index = text::GraphemeIndex::build(context.currentText);
    const auto hostRange = index ? text::toHostRange(*index, context.range, profile_.indexUnit) : std::nullopt;
    if (!hostRange) {
        return ReplacementOutcome::failure(FailureKind::IndexOutOfBounds, "range not convertible to host units");
    }

    const QueryError selected = host_.setSelection(context.element, *hostRange);
    if (selected == QueryError::Timeout) {
        return ReplacementOutcome::failure(FailureKind::HostUnresponsive, "selection timed out");
    }
    if (selected != QueryError::Ok) {
        // Some hosts report failure yet select; the readback decides.
        REDLINE_LOG_DEBUG("setSelection reported %s", toString(selected));
    }

    const QueryResult<std::string> readback = host_.readSelection(context.element);
    if (!readback) {
        return ReplacementOutcome::failure(kindFor(readback.error, FailureKind::ContentNotReachable),
                                           std::string("selection readback: ") + toString(readback.error));
    }
    if (*readback != context.errorText) {
        return ReplacementOutcome::failure(FailureKind::ContentNotReachable,
                                           "selection holds '" + *readback + "'");
    }

    if (profile_.replacementMethod == config::ReplacementMethod::DirectSetText) {
        const QueryError replaced = host_.replaceSelectedText(context.element, context.suggestion);
        if (replaced == QueryError::Ok) {
            return ReplacementOutcome::success(false);
        }
        if (replaced != QueryError::NotSupported) {
            return ReplacementOutcome::failure(kindFor(replaced, FailureKind::InjectionFailed),
                                               std::string("set text: ") + toString(replaced));
        }
        REDLINE_LOG_DEBUG("direct set text unsupported, pasting instead");
    }
    return pasteReplacement(context);
}

ReplacementOutcome ReplacementExecutor::pasteReplacement(const ReplacementContext& context) {
    QueryResult<host::ClipboardContents> original = host_.readClipboard();
    if (!original) {
        return ReplacementOutcome::failure(kindFor(original.error, FailureKind::ClipboardUnavailable),
                                           std::string("save clipboard: ") + toString(original.error));
    }
    ClipboardGuard guard(host_, std::move(*original.value));

    host::ClipboardContents payload{plainTextItem(context.suggestion)};
    bool formattingPreserved = false;
    if (profile_.preservesFormatting) {
        if (auto rich = buildRichPayload(context, guard)) {
            payload.push_back(std::move(*rich));
            formattingPreserved = true;
        }
    }

    const QueryError written = host_.writeClipboard(payload);
    guard.noteOwnWrite();
    if (written != QueryError::Ok) {
        return ReplacementOutcome::failure(kindFor(written, FailureKind::ClipboardUnavailable),
                                           std::string("write clipboard: ") + toString(written));
    }

    const QueryError pasted = host_.injectPaste();
    if (pasted != QueryError::Ok) {
        return ReplacementOutcome::failure(kindFor(pasted, FailureKind::InjectionFailed),
                                           std::string("paste: ") + toString(pasted));
    }

    // The host reads the clipboard asynchronously after the keystroke.
    settle(profile_.timing.pasteSettleMs);
    const QueryError restored = guard.restore();
    if (restored != QueryError::Ok) {
        REDLINE_LOG_WARN("clipboard restore failed after paste: %s", toString(restored));
    }
    return ReplacementOutcome::success(formattingPreserved);
}

std::optional<host::ClipboardItem> ReplacementExecutor::buildRichPayload(
    const ReplacementContext& context,
    ClipboardGuard& guard) {
    const QueryError copied = host_.injectCopy();
    if (copied != QueryError::Ok) {
        guard.noteOwnWrite();
        REDLINE_LOG_WARN("copy for formatting failed (%s), using plain text", toString(copied));
        return std::nullopt;
    }
    settle(profile_.timing.copySettleMs);
    guard.noteOwnWrite();

    const QueryResult<host::ClipboardContents> copy = host_.readClipboard();
    if (!copy) {
        REDLINE_LOG_WARN("reading copied selection failed (%s), using plain text", toString(copy.error));
        return std::nullopt;
    }
    const host::ClipboardItem* custom = nullptr;
    for (const auto& item : *copy) {
        if (item.typeTag == codec::kWebCustomDataType) custom = &item;
    }
    if (!custom) {
        REDLINE_LOG_WARN("copied selection has no custom data, using plain text");
        return std::nullopt;
    }

    codec::PickleContainer container;
    const codec::DecodeError decoded = codec::decodePickle(custom->bytes.data(), custom->bytes.size(), container);
    if (decoded != codec::DecodeError::Ok) {
        REDLINE_LOG_WARN("custom data undecodable (%s), using plain text", codec::toString(decoded));
        return std::nullopt;
    }
    const std::u16string deltaType = utf16Of(profile_.richTextType.c_str());
    const codec::PickleEntry* entry = codec::findEntry(container, deltaType);
    if (!entry) {
        REDLINE_LOG_WARN("no %s entry in custom data, using plain text", profile_.richTextType.c_str());
        return std::nullopt;
    }

    richtext::RichTextDelta delta;
    const richtext::DeltaError parsed = richtext::parseDelta(utf16ToUtf8(entry->value), delta);
    if (parsed != richtext::DeltaError::Ok) {
        REDLINE_LOG_WARN("delta unparsable (%s), using plain text", richtext::toString(parsed));
        return std::nullopt;
    }

    // The copied delta covers exactly the selection, so the error starts at 0.
    const richtext::CorrectionResult corrected =
        richtext::applyCorrection(delta, context.errorText, context.suggestion, 0u);
    if (corrected.status != richtext::CorrectionStatus::Ok) {
        REDLINE_LOG_WARN("delta correction: %s, using plain text", richtext::toString(corrected.status));
        return std::nullopt;
    }

    codec::setEntry(container, deltaType, utf8ToUtf16(richtext::serializeDelta(corrected.delta)));
    const std::u16string plainType = utf16Of("text/plain");
    if (codec::findEntry(container, plainType)) {
        codec::setEntry(container, plainType, utf8ToUtf16(context.suggestion));
    }
    return host::ClipboardItem{codec::kWebCustomDataType, codec::encodePickle(container)};
}

} // namespace redline::replacement
