#pragma once
#include <cstddef>

struct BencodeOptions {
    // Deepest dictionary/list nesting accepted by the parser. Also bounds the
    // recursion of every decode over the resulting tree.
    size_t maxDepth = 512;

    // Canonical bencode forbids `i-0e`; accepted unless this is set.
    bool rejectNegativeZero = false;

    // By default the last occurrence of a repeated key wins.
    bool rejectDuplicateKeys = false;
};
