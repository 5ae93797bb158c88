#include <linegrep/compiler.hpp>
#include <linegrep/errors.hpp>
#include <linegrep/search_options.hpp>

static const hs_platform_info_t *host_platform() {
  static hs_platform_info_t platform{};
  static const bool populated = hs_populate_platform(&platform) == HS_SUCCESS;
  return populated ? &platform : NULL;
}

void compile_hs_database(hs_database **database, hs_scratch **scratch,
                         const search_options &options,
                         const std::string &pattern) {

  hs_error_t error_code;
  hs_compile_error_t *compile_error = NULL;

  // Every match needs its start offset to build spans
  const unsigned int common_flags =
      HS_FLAG_SOM_LEFTMOST | (options.ignore_case ? HS_FLAG_CASELESS : 0);

  // An empty literal matches everywhere, which only the regex path allows
  if (options.compile_pattern_as_literal && !pattern.empty()) {
    error_code = hs_compile_lit(pattern.data(), common_flags, pattern.size(),
                                HS_MODE_BLOCK, host_platform(), database,
                                &compile_error);
  } else {
    error_code = hs_compile(pattern.c_str(),
                            common_flags | HS_FLAG_UTF8 | HS_FLAG_ALLOWEMPTY |
                                (options.use_ucp ? HS_FLAG_UCP : 0),
                            HS_MODE_BLOCK, host_platform(), database,
                            &compile_error);
  }

  if (error_code != HS_SUCCESS) {
    const std::string message =
        compile_error ? compile_error->message : "unknown error";
    if (compile_error) {
      hs_free_compile_error(compile_error);
    }
    throw invalid_pattern(message);
  }

  auto database_error = hs_alloc_scratch(*database, scratch);
  if (database_error != HS_SUCCESS) {
    hs_free_database(*database);
    *database = NULL;
    throw search_error("Error allocating scratch space");
  }
}
