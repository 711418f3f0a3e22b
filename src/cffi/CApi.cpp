#include "sthe/sthe.h"

#include "sthe/codec/SpecCodec.hpp"
#include "sthe/codec/ValueCodec.hpp"
#include "sthe/extract/Compiler.hpp"
#include "sthe/extract/Extractor.hpp"
#include "sthe/util/Logging.hpp"

#include <cstdlib>
#include <cstring>
#include <exception>
#include <new>
#include <optional>
#include <string>

struct SthePreparedOpt {
    explicit SthePreparedOpt(sthe::extract::CompiledOption compiled)
        : option(std::move(compiled)) {}

    sthe::extract::CompiledOption option;
};

namespace {
using namespace sthe;

std::optional<codec::Format> toFormat(SthePayloadFormat ty) {
    switch (ty) {
    case STHE_FORMAT_JSON: return codec::Format::json;
    case STHE_FORMAT_TOML: return codec::Format::toml;
    }
    return std::nullopt;
}

const char* copyOut(const std::string& text) {
    auto* buffer = static_cast<char*>(std::malloc(text.size() + 1));
    if (!buffer) {
        throw std::bad_alloc();
    }
    std::memcpy(buffer, text.data(), text.size());
    buffer[text.size()] = '\0';
    return buffer;
}

template <typename Evaluate>
StheResult extractWith(const char* input, const SthePreparedOpt* opt, SthePayloadFormat ty, const char** out,
                       const char* operation, Evaluate evaluate) {
    auto format = toFormat(ty);
    if (!input || !opt || !out || !format) {
        util::log(util::LogLevel::debug, std::string{operation} + ": invalid arguments");
        return STHE_INVALID_ARGS;
    }
    try {
        auto value = evaluate(std::string_view{input}, opt->option);
        *out = copyOut(codec::serializeValue(value, *format));
        return STHE_OK;
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::debug, std::string{operation} + ": " + ex.what());
    } catch (...) {
        util::log(util::LogLevel::debug, std::string{operation} + ": unknown failure");
    }
    return STHE_INVALID_ARGS;
}

} // namespace

extern "C" {

StheResult sthe_compile_opt(const char* descp, SthePayloadFormat ty, const SthePreparedOpt** out) {
    auto format = toFormat(ty);
    if (!descp || !out || !format) {
        util::log(util::LogLevel::debug, "sthe_compile_opt: invalid arguments");
        return STHE_INVALID_ARGS;
    }
    try {
        auto spec = codec::parseSpec(descp, *format);
        *out = new SthePreparedOpt(extract::compile(spec));
        return STHE_OK;
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::debug, std::string{"sthe_compile_opt: "} + ex.what());
    } catch (...) {
        util::log(util::LogLevel::debug, "sthe_compile_opt: unknown failure");
    }
    return STHE_INVALID_ARGS;
}

void sthe_release_opt(const SthePreparedOpt* opt) {
    delete opt;
}

StheResult sthe_extract_fragment(const char* fragment, const SthePreparedOpt* opt, SthePayloadFormat ty,
                                 const char** out) {
    return extractWith(fragment, opt, ty, out, "sthe_extract_fragment", &extract::extractFragment);
}

StheResult sthe_extract_document(const char* document, const SthePreparedOpt* opt, SthePayloadFormat ty,
                                 const char** out) {
    return extractWith(document, opt, ty, out, "sthe_extract_document", &extract::extractDocument);
}

void sthe_release_extract(const char* ret) {
    std::free(const_cast<char*>(ret));
}

} // extern "C"
