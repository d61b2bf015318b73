
/* chapter_file.hpp

Names of the files the extractor writes chapters to.

A book may contain several chapters with the same id, so the name carries the
chapter's position in the table of contents in front of its id, e.g. the third
chapter with id 22 is written to "2_22.chapter".
*/

#pragma once

#include "shl/number_types.hpp"

#define BOOKER_CHAPTER_EXTENSION ".chapter"

// writes the file name of the chapter at index with the given id into out.
// returns the length of the name, or -1 if it does not fit into out_size bytes.
s64 booker_chapter_file_name(s64 index, u64 id, char *out, s64 out_size);
