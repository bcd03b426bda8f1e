#include "file.h"
#include "log.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>

char* read_binary_file(const char *filename, size_t* out_size) {
    if (out_size) *out_size = 0;
    if (!filename) return NULL;
    FILE* fp = fopen(filename, "rb");
    if (!fp) {
        log_debug("read_binary_file: cannot open %s", filename);
        return NULL;
    }
    if (fseek(fp, 0, SEEK_END) != 0) { fclose(fp);  return NULL; }
    long size = ftell(fp);
    if (size < 0 || fseek(fp, 0, SEEK_SET) != 0) { fclose(fp);  return NULL; }

    char* buf = (char*)malloc((size_t)size + 1);
    if (!buf) {
        log_error("read_binary_file: out of memory for %s (%ld bytes)", filename, size);
        fclose(fp);
        return NULL;
    }
    size_t read = fread(buf, 1, (size_t)size, fp);
    if (read != (size_t)size) {
        log_error("read_binary_file: short read on %s (%zu of %ld bytes)", filename, read, size);
        free(buf);  fclose(fp);
        return NULL;
    }
    buf[read] = '\0';
    fclose(fp);
    if (out_size) *out_size = read;
    return buf;
}

char* read_text_file(const char *filename) {
    size_t size = 0;
    char* buf = read_binary_file(filename, &size);
    if (!buf) return NULL;
    // skip UTF-8 BOM if present
    if (size >= 3 && (unsigned char)buf[0] == 0xEF && (unsigned char)buf[1] == 0xBB &&
        (unsigned char)buf[2] == 0xBF) {
        memmove(buf, buf + 3, size - 3 + 1);
    }
    return buf;
}

bool file_exists(const char* path) {
    if (!path || !*path) return false;
    struct stat st;
    if (stat(path, &st) != 0) return false;
    return S_ISREG(st.st_mode);
}

char* path_join(const char* dir, const char* name) {
    if (!dir || !*dir) return name ? strdup(name) : NULL;
    if (!name) return strdup(dir);
    size_t dlen = strlen(dir);
    while (dlen > 1 && dir[dlen - 1] == '/') dlen--;
    while (*name == '/') name++;
    size_t nlen = strlen(name);
    size_t sep = dir[dlen - 1] == '/' ? 0 : 1;
    char* out = (char*)malloc(dlen + sep + nlen + 1);
    if (!out) return NULL;
    memcpy(out, dir, dlen);
    if (sep) out[dlen] = '/';
    memcpy(out + dlen + sep, name, nlen + 1);
    return out;
}
