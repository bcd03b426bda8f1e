#ifndef FILE_H
#define FILE_H

#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Read a whole file into a NUL-terminated buffer; caller frees.
// out_size receives the byte count (excluding the terminator) when non-NULL.
char* read_binary_file(const char *filename, size_t* out_size);

// Text variant of read_binary_file(); strips a leading UTF-8 BOM.
char* read_text_file(const char *filename);

// True when path names an existing regular file
bool file_exists(const char* path);

// Join dir and name with a single '/'; caller frees.
char* path_join(const char* dir, const char* name);

#ifdef __cplusplus
}
#endif

#endif // FILE_H
