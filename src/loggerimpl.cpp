//
// Created by cory on 4/12/25.
//
#include "logger.hpp"

Logger logs;

Logger& logger()
{
    return logs;
}

Logger::Logger() : level(LOG_INFO)
{}

void Logger::info(const char *str)
{
    if (level <= LOG_INFO)
    {
        printf("[INFO] %s\n", str);
    }
}

void Logger::warn(const char *str)
{
    if (level <= LOG_WARN)
    {
        printf("[WARN] %s\n", str);
    }
}

void Logger::err(const char *str)
{
    if (level <= LOG_ERR)
    {
        fprintf(stderr, "[ERROR] %s\n", str);
    }
}
