#pragma once
#include <hs/hs.h>
#include <string>

struct search_options;

/// Compiles `pattern` into a block mode database and allocates a scratch
/// space for it. Throws invalid_pattern if Hyperscan rejects the pattern.
void compile_hs_database(hs_database **database, hs_scratch **scratch,
                         const search_options &options,
                         const std::string &pattern);
