#include <stdio.h>

#include "shl/assert.hpp"
#include "chapter_file.hpp"

s64 booker_chapter_file_name(s64 index, u64 id, char *out, s64 out_size)
{
    assert(out != nullptr);
    assert(out_size > 0);

    int len = snprintf(out, (size_t)out_size, "%lld_%llu" BOOKER_CHAPTER_EXTENSION, (long long)index, (unsigned long long)id);

    if (len < 0 || len >= out_size)
        return -1;

    return len;
}
