// log.cpp - ring-buffer logger shared by the console and the host build
#include <cstdio>
#include <string>
#include <vector>
#ifdef PLATFORM_3DS
#include <3ds.h>
#endif
#include "hardware.hpp"

namespace {
    std::vector<std::string> g_logs;
    const size_t kMaxLogLines = 64;

    void emit(const std::string &line) {
        std::string outLine = line + "\n";
#ifdef PLATFORM_3DS
        svcOutputDebugString(outLine.c_str(), (s32)outLine.size());
#endif
        fprintf(stderr, "%s", outLine.c_str());
    }
}

const std::vector<std::string>& hw_log_lines() { return g_logs; }

void hw_log(const char* msg) {
    if(!msg) return;
    // Split into lines, coalesce immediate repeats, store and forward.
    const char* p = msg;
    static std::string lastLine;
    static int repeatCount = 0;
    while(*p) {
        const char* start = p;
        while(*p && *p!='\n') ++p;
        std::string line(start, p-start);
        if(!line.empty()) {
            if(line == lastLine && !g_logs.empty()) {
                ++repeatCount;
                g_logs.back() = lastLine + " (x" + std::to_string(repeatCount) + ")";
            } else {
                if(repeatCount > 1) emit(lastLine + " (x" + std::to_string(repeatCount) + ")");
                lastLine = line;
                repeatCount = 1;
                g_logs.push_back(line);
                if(g_logs.size() > kMaxLogLines) g_logs.erase(g_logs.begin(), g_logs.begin() + (g_logs.size()-kMaxLogLines));
                emit(line);
            }
        }
        if(*p=='\n') ++p; // skip newline
    }
}
