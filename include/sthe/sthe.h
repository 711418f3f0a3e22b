#ifndef STHE_STHE_H
#define STHE_STHE_H

#ifdef __cplusplus
extern "C" {
#endif

typedef enum SthePayloadFormat {
    STHE_FORMAT_JSON,
    STHE_FORMAT_TOML
} SthePayloadFormat;

typedef enum StheResult {
    STHE_OK,
    STHE_INVALID_ARGS
} StheResult;

/* Compiled extraction option. Opaque; immutable once created. */
typedef struct SthePreparedOpt SthePreparedOpt;

/* Parses `descp` as a specification in format `ty` and compiles it. On
 * STHE_OK, `*out` owns a new handle to be freed with sthe_release_opt.
 * On failure `*out` is not written. */
StheResult sthe_compile_opt(const char *descp, SthePayloadFormat ty, const SthePreparedOpt **out);

/* NULL is accepted and ignored. */
void sthe_release_opt(const SthePreparedOpt *opt);

/* Evaluates `opt` over an HTML fragment or a full document and serializes
 * the result in format `ty`. On STHE_OK, `*out` is a NUL-terminated string
 * to be freed with sthe_release_extract. */
StheResult sthe_extract_fragment(const char *fragment, const SthePreparedOpt *opt, SthePayloadFormat ty, const char **out);
StheResult sthe_extract_document(const char *document, const SthePreparedOpt *opt, SthePayloadFormat ty, const char **out);

void sthe_release_extract(const char *ret);

#ifdef __cplusplus
}
#endif

#endif /* STHE_STHE_H */
