#include "log.h"
#include <string.h>
#include <stdlib.h>
#include <ctype.h>
#include <time.h>

static log_category_t categories[LOG_MAX_CATEGORIES];
static int category_count = 0;
static int timestamps_enabled = 0;
static int colors_enabled = 0;

log_category_t *log_default_category = NULL;

static const char* level_color(int level) {
    if (level >= LOG_LEVEL_ERROR) return "\x1b[31m";
    if (level >= LOG_LEVEL_WARN) return "\x1b[33m";
    if (level >= LOG_LEVEL_NOTICE) return "\x1b[36m";
    return "\x1b[90m";
}

static log_category_t* add_category(const char *cname) {
    if (category_count >= LOG_MAX_CATEGORIES) return NULL;
    log_category_t* cat = &categories[category_count++];
    memset(cat, 0, sizeof(*cat));
    strncpy(cat->name, cname, sizeof(cat->name) - 1);
    cat->level = LOG_LEVEL_WARN;
    cat->output = stderr;
    cat->enabled = 1;
    return cat;
}

static log_category_t* find_category(const char *cname) {
    for (int i = 0; i < category_count; i++) {
        if (strcmp(categories[i].name, cname) == 0) return &categories[i];
    }
    return NULL;
}

static void close_output(log_category_t* cat) {
    if (cat->owns_output && cat->output) {
        fclose(cat->output);
    }
    cat->owns_output = 0;
    cat->output = stderr;
}

int log_init(const char *config) {
    if (!find_category("default")) {
        if (!add_category("default")) return LOG_INIT_FAIL;
    }
    log_default_category = find_category("default");
    if (config && *config) {
        return log_parse_config_string(config);
    }
    return LOG_OK;
}

void log_finish(void) {
    for (int i = 0; i < category_count; i++) {
        if (categories[i].output) fflush(categories[i].output);
        close_output(&categories[i]);
    }
    category_count = 0;
    log_default_category = NULL;
}

log_category_t* log_get_category(const char *cname) {
    if (!cname || !*cname) return log_default_category;
    log_category_t* cat = find_category(cname);
    if (cat) return cat;
    cat = add_category(cname);
    if (cat && log_default_category) {
        // new categories inherit the default rule; a NULL output follows the default's stream
        cat->level = log_default_category->level;
        cat->output = NULL;
    }
    return cat;
}

const char* log_level_to_string(int level) {
    switch (level) {
        case LOG_LEVEL_DEBUG:  return "DEBUG";
        case LOG_LEVEL_INFO:   return "INFO";
        case LOG_LEVEL_NOTICE: return "NOTICE";
        case LOG_LEVEL_WARN:   return "WARN";
        case LOG_LEVEL_ERROR:  return "ERROR";
        case LOG_LEVEL_FATAL:  return "FATAL";
        default:               return "UNKNOWN";
    }
}

int log_level_from_string(const char *name) {
    if (!name) return -1;
    char upper[16];
    size_t n = 0;
    for (; name[n] && n < sizeof(upper) - 1; n++) {
        upper[n] = (char)toupper((unsigned char)name[n]);
    }
    upper[n] = '\0';
    if (strcmp(upper, "DEBUG") == 0) return LOG_LEVEL_DEBUG;
    if (strcmp(upper, "INFO") == 0) return LOG_LEVEL_INFO;
    if (strcmp(upper, "NOTICE") == 0) return LOG_LEVEL_NOTICE;
    if (strcmp(upper, "WARN") == 0) return LOG_LEVEL_WARN;
    if (strcmp(upper, "ERROR") == 0) return LOG_LEVEL_ERROR;
    if (strcmp(upper, "FATAL") == 0) return LOG_LEVEL_FATAL;
    return -1;
}

int log_level_enabled(log_category_t *category, const int level) {
    if (!category) category = log_default_category;
    if (!category || !category->enabled) return 0;
    return level >= category->level;
}

void log_set_level(log_category_t *category, int level) {
    if (!category) category = log_default_category;
    if (category) category->level = level;
}

void log_set_output(log_category_t *category, FILE *output) {
    if (!category) category = log_default_category;
    if (!category) return;
    close_output(category);
    category->output = output ? output : stderr;
}

void log_enable_timestamps(int enable) { timestamps_enabled = enable; }
void log_enable_colors(int enable) { colors_enabled = enable; }

int clog_vlog(log_category_t *category, int level, const char *format, va_list args) {
    if (!category) category = log_default_category;
    if (!category) {
        // logging before log_init() goes to stderr for warnings and above
        if (level < LOG_LEVEL_WARN) return LOG_OK;
        vfprintf(stderr, format, args);
        fputc('\n', stderr);
        return LOG_OK;
    }
    if (!log_level_enabled(category, level)) return LOG_OK;

    FILE* out = category->output;
    if (!out && log_default_category) out = log_default_category->output;
    if (!out) out = stderr;
    bool tty_color = colors_enabled && (out == stderr || out == stdout);
    if (timestamps_enabled) {
        char stamp[32];
        time_t now = time(NULL);
        struct tm tm_now;
        localtime_r(&now, &tm_now);
        strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_now);
        fprintf(out, "%s ", stamp);
    }
    if (tty_color) fputs(level_color(level), out);
    fprintf(out, "[%s]", log_level_to_string(level));
    if (tty_color) fputs("\x1b[0m", out);
    if (category != log_default_category) fprintf(out, " [%s]", category->name);
    fputc(' ', out);
    if (vfprintf(out, format, args) < 0) return LOG_WRITE_FAIL;
    fputc('\n', out);
    if (level >= LOG_LEVEL_ERROR) fflush(out);
    return LOG_OK;
}

#define DEFINE_CLOG(fn, level)                                              \
    int fn(log_category_t *category, const char *format, ...) {             \
        va_list args;                                                       \
        va_start(args, format);                                             \
        int rc = clog_vlog(category, level, format, args);                  \
        va_end(args);                                                       \
        return rc;                                                          \
    }

#define DEFINE_LOG(fn, level)                                               \
    int fn(const char *format, ...) {                                       \
        va_list args;                                                       \
        va_start(args, format);                                             \
        int rc = clog_vlog(log_default_category, level, format, args);      \
        va_end(args);                                                       \
        return rc;                                                          \
    }

DEFINE_CLOG(clog_fatal, LOG_LEVEL_FATAL)
DEFINE_CLOG(clog_error, LOG_LEVEL_ERROR)
DEFINE_CLOG(clog_warn, LOG_LEVEL_WARN)
DEFINE_CLOG(clog_notice, LOG_LEVEL_NOTICE)
DEFINE_CLOG(clog_info, LOG_LEVEL_INFO)
DEFINE_CLOG(clog_debug, LOG_LEVEL_DEBUG)

DEFINE_LOG(log_fatal, LOG_LEVEL_FATAL)
DEFINE_LOG(log_error, LOG_LEVEL_ERROR)
DEFINE_LOG(log_warn, LOG_LEVEL_WARN)
DEFINE_LOG(log_notice, LOG_LEVEL_NOTICE)
DEFINE_LOG(log_info, LOG_LEVEL_INFO)
DEFINE_LOG(log_debug, LOG_LEVEL_DEBUG)

static char* trim_in_place(char* s) {
    while (*s && isspace((unsigned char)*s)) s++;
    char* end = s + strlen(s);
    while (end > s && isspace((unsigned char)end[-1])) *--end = '\0';
    return s;
}

// parse one rule: "<category>.<LEVEL> <output>" or "<switch>=on|off"
static int parse_config_line(char* line) {
    char* hash = strchr(line, '#');
    if (hash) *hash = '\0';
    line = trim_in_place(line);
    if (!*line) return LOG_OK;

    char* eq = strchr(line, '=');
    if (eq) {
        *eq = '\0';
        char* key = trim_in_place(line);
        char* value = trim_in_place(eq + 1);
        int on = (strcmp(value, "on") == 0 || strcmp(value, "1") == 0 || strcmp(value, "true") == 0);
        if (strcmp(key, "timestamps") == 0) { log_enable_timestamps(on);  return LOG_OK; }
        if (strcmp(key, "colors") == 0) { log_enable_colors(on);  return LOG_OK; }
        return LOG_WRONG_FORMAT;
    }

    char* sep = line;
    while (*sep && !isspace((unsigned char)*sep)) sep++;
    char* output = NULL;
    if (*sep) { *sep = '\0';  output = trim_in_place(sep + 1); }

    char* dot = strrchr(line, '.');
    if (!dot || dot == line) return LOG_WRONG_FORMAT;
    *dot = '\0';
    int level = log_level_from_string(dot + 1);
    if (level < 0) return LOG_WRONG_FORMAT;

    log_category_t* cat = find_category(line);
    if (!cat) cat = add_category(line);
    if (!cat) return LOG_CATEGORY_NOT_FOUND;
    cat->level = level;
    cat->enabled = 1;

    if (output && *output) {
        if (strcmp(output, "stdout") == 0 || strcmp(output, ">stdout") == 0) {
            log_set_output(cat, stdout);
        } else if (strcmp(output, "stderr") == 0 || strcmp(output, ">stderr") == 0) {
            log_set_output(cat, stderr);
        } else {
            size_t len = strlen(output);
            if (len >= 2 && output[0] == '"' && output[len - 1] == '"') {
                output[len - 1] = '\0';  output++;
            }
            FILE* fp = fopen(output, "a");
            if (!fp) return LOG_INIT_FAIL;
            log_set_output(cat, fp);
            cat->owns_output = 1;
        }
    }
    return LOG_OK;
}

int log_parse_config_string(const char *config) {
    if (!config) return LOG_WRONG_FORMAT;
    if (!find_category("default")) add_category("default");
    log_default_category = find_category("default");

    char* copy = strdup(config);
    if (!copy) return LOG_INIT_FAIL;
    int result = LOG_OK;
    char* save = NULL;
    for (char* line = strtok_r(copy, "\n", &save); line; line = strtok_r(NULL, "\n", &save)) {
        int rc = parse_config_line(line);
        if (rc != LOG_OK) result = rc;
    }
    free(copy);
    return result;
}

int log_parse_config_file(const char *filename) {
    FILE* fp = fopen(filename, "r");
    if (!fp) return LOG_INIT_FAIL;
    fseek(fp, 0, SEEK_END);
    long size = ftell(fp);
    fseek(fp, 0, SEEK_SET);
    if (size < 0) { fclose(fp);  return LOG_INIT_FAIL; }
    char* buf = (char*)malloc((size_t)size + 1);
    if (!buf) { fclose(fp);  return LOG_INIT_FAIL; }
    size_t read = fread(buf, 1, (size_t)size, fp);
    buf[read] = '\0';
    fclose(fp);
    int rc = log_parse_config_string(buf);
    free(buf);
    return rc;
}
