#ifndef JSON_BUFFER_H
#define JSON_BUFFER_H

#include <math.h>
#include <stdarg.h>
#include <stddef.h>
#include <stdio.h>

// Flat JSON object written in place with snprintf. Non-finite numbers and
// null strings become null, string values are escaped. finish() returns 0
// if anything was truncated.
class JsonBuffer {
private:
    char* out;
    size_t size;
    size_t used;
    bool overflow;
    bool first;

    void appendf(const char* format, ...) {
        if (overflow) return;
        va_list args;
        va_start(args, format);
        int n = vsnprintf(out + used, size - used, format, args);
        va_end(args);
        if (n < 0 || (size_t)n >= size - used) {
            overflow = true;
            return;
        }
        used += (size_t)n;
    }

    void escaped(const char* value) {
        appendf("\"");
        for (const char* c = value; *c && !overflow; c++) {
            unsigned char ch = (unsigned char)*c;
            if (ch == '"' || ch == '\\') appendf("\\%c", ch);
            else if (ch == '\n') appendf("\\n");
            else if (ch == '\r') appendf("\\r");
            else if (ch == '\t') appendf("\\t");
            else if (ch < 0x20) appendf("\\u%04x", (unsigned)ch);
            else appendf("%c", ch);
        }
        appendf("\"");
    }

    void key(const char* name) {
        appendf(first ? "\"%s\":" : ",\"%s\":", name);
        first = false;
    }

public:
    JsonBuffer(char* buffer, size_t length)
        : out(buffer), size(length), used(0), overflow(length == 0), first(true) {
        appendf("{");
    }

    void string(const char* name, const char* value) {
        key(name);
        if (value) escaped(value);
        else appendf("null");
    }

    void number(const char* name, float value, int decimals) {
        key(name);
        if (isfinite(value)) appendf("%.*f", decimals, (double)value);
        else appendf("null");
    }

    void integer(const char* name, long value) {
        key(name);
        appendf("%ld", value);
    }

    void boolean(const char* name, bool value) {
        key(name);
        appendf(value ? "true" : "false");
    }

    void null(const char* name) {
        key(name);
        appendf("null");
    }

    size_t finish() {
        appendf("}");
        return overflow ? 0 : used;
    }
};

#endif
