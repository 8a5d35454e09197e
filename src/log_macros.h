/**
 * @file log_macros.h
 * @brief Shared logging macros for the session_*.cpp files.
 *
 * In TESTING builds the macros embed the `this` pointer so that log lines
 * from several SessionManager instances living in one test process can be
 * told apart.
 */

#ifndef LANMEET_LOG_MACROS_H
#define LANMEET_LOG_MACROS_H

#include "logger.h"

#ifdef TESTING
#define LOG_CLIENT_DEBUG(message) LOG_DEBUG("client", "[pointer: " << this << "] " << message)
#define LOG_CLIENT_INFO(message)  LOG_INFO("client", "[pointer: " << this << "] " << message)
#define LOG_CLIENT_WARN(message)  LOG_WARN("client", "[pointer: " << this << "] " << message)
#define LOG_CLIENT_ERROR(message) LOG_ERROR("client", "[pointer: " << this << "] " << message)

#define LOG_HOST_DEBUG(message) LOG_DEBUG("host", "[pointer: " << this << "] " << message)
#define LOG_HOST_INFO(message)  LOG_INFO("host", "[pointer: " << this << "] " << message)
#define LOG_HOST_WARN(message)  LOG_WARN("host", "[pointer: " << this << "] " << message)
#define LOG_HOST_ERROR(message) LOG_ERROR("host", "[pointer: " << this << "] " << message)
#else
#define LOG_CLIENT_DEBUG(message) LOG_DEBUG("client", message)
#define LOG_CLIENT_INFO(message)  LOG_INFO("client", message)
#define LOG_CLIENT_WARN(message)  LOG_WARN("client", message)
#define LOG_CLIENT_ERROR(message) LOG_ERROR("client", message)

#define LOG_HOST_DEBUG(message) LOG_DEBUG("host", message)
#define LOG_HOST_INFO(message)  LOG_INFO("host", message)
#define LOG_HOST_WARN(message)  LOG_WARN("host", message)
#define LOG_HOST_ERROR(message) LOG_ERROR("host", message)
#endif

#endif // LANMEET_LOG_MACROS_H
