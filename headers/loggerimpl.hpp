//
// Created by cory on 4/12/25.
//

#ifndef KELP_LOGGERIMPL_HPP
#define KELP_LOGGERIMPL_HPP


#include <cstdio>
#include <utility>

enum LogLevel
{
    LOG_INFO, LOG_WARN, LOG_ERR, LOG_OFF
};

class Logger
{
public:
    Logger();

    /**
     * Messages below the given level are dropped.
     */
    inline void set_level(LogLevel min_level) { level = min_level; }

    [[nodiscard]] inline LogLevel get_level() const { return level; }

    void info(const char* str);

    template<typename... Args>
    void info(const char* str, Args... args)
    {
        if (level <= LOG_INFO)
        {
            printf("[INFO] ");
            printf(str, std::forward<Args>(args)...);
            printf("\n");
        }
    }

    void warn(const char* str);

    template<typename... Args>
    void warn(const char* str, Args... args)
    {
        if (level <= LOG_WARN)
        {
            printf("[WARN] ");
            printf(str, std::forward<Args>(args)...);
            printf("\n");
        }
    }

    void err(const char* str);

    template<typename... Args>
    void err(const char* str, Args... args)
    {
        if (level <= LOG_ERR)
        {
            fprintf(stderr, "[ERROR] ");
            fprintf(stderr, str, std::forward<Args>(args)...);
            fprintf(stderr, "\n");
        }
    }
private:
    LogLevel level;
};


#endif //KELP_LOGGERIMPL_HPP
