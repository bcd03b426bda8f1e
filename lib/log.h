/* svgraster log library - zlog-compatible API with log_ prefix */
#ifndef LOG_H
#define LOG_H

#include <stdint.h>
#include <stddef.h>
#include <stdio.h>
#include <stdarg.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Return codes */
#define LOG_OK                  0
#define LOG_WRONG_FORMAT       -3
#define LOG_WRITE_FAIL         -4
#define LOG_INIT_FAIL          -5
#define LOG_CATEGORY_NOT_FOUND -6

#define LOG_MAX_CATEGORIES 16

/* Log levels */
typedef enum {
    LOG_LEVEL_DEBUG = 20,
    LOG_LEVEL_INFO = 40,
    LOG_LEVEL_NOTICE = 60,
    LOG_LEVEL_WARN = 80,
    LOG_LEVEL_ERROR = 100,
    LOG_LEVEL_FATAL = 120
} log_level;

/* log category structure */
typedef struct log_category_s {
    char name[64];      /* category name */
    int level;          /* current log level */
    FILE *output;       /* output stream (stdout, stderr, or file); NULL follows the default category */
    int owns_output;    /* output was opened from a config rule */
    int enabled;        /* whether this category is enabled */
} log_category_t;

/* Setup and teardown. log_init(NULL) or log_init("") keeps any rules
   already loaded by log_parse_config_file() */
int log_init(const char *config);
void log_finish(void);
log_category_t* log_get_category(const char *cname);

/* Core logging functions with category parameter */
int clog_fatal(log_category_t *category, const char *format, ...);
int clog_error(log_category_t *category, const char *format, ...);
int clog_warn(log_category_t *category, const char *format, ...);
int clog_notice(log_category_t *category, const char *format, ...);
int clog_info(log_category_t *category, const char *format, ...);
int clog_debug(log_category_t *category, const char *format, ...);
int clog_vlog(log_category_t *category, int level, const char *format, va_list args);

/* Default category logging functions */
int log_fatal(const char *format, ...);
int log_error(const char *format, ...);
int log_warn(const char *format, ...);
int log_notice(const char *format, ...);
int log_info(const char *format, ...);
int log_debug(const char *format, ...);

/* Level check functions */
int log_level_enabled(log_category_t *category, const int level);
void log_set_level(log_category_t *category, int level);
void log_set_output(log_category_t *category, FILE *output);

extern log_category_t *log_default_category;

/* Utility functions */
void log_enable_timestamps(int enable);
void log_enable_colors(int enable);
const char* log_level_to_string(int level);
int log_level_from_string(const char *name);

/* Configuration parsing, see log.conf */
int log_parse_config_file(const char *filename);
int log_parse_config_string(const char *config);

#ifdef __cplusplus
}
#endif

#endif /* LOG_H */
