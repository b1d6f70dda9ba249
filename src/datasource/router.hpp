#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include <datasource/reply.hpp>
#include <datasource/request.hpp>

namespace datasource {

enum class HandlerResult { Matched, NoMatch };

// A lightweight router to be used in added RequestHandlers.
//
// Patterns are made of literal segments, "{name}" parameters matching exactly
// one segment and an optional trailing "{name*}" that captures the rest of
// the request path verbatim (possibly empty, possibly containing '/').
class Router {
   public:
    using Handler = std::function<void(
        const Request &, Reply &, const std::unordered_map<std::string, std::string> &)>;

    // Add a route with method, path pattern and handler. Returns false if the
    // pattern is malformed, e.g. a catch-all that is not the last segment.
    bool addRoute(const std::string &method, const std::string &pathPattern, Handler handler);

    // Handle an incoming request
    HandlerResult handle(const Request &req, Reply &rep);

   private:
    struct RouteEntry {
        std::vector<std::string> pathSegments;
        std::vector<bool> isParameter;        // true if segment is a parameter
        std::vector<std::string> paramNames;  // parameter names for segments that are parameters
        std::string catchAllName;             // empty if the route has no catch-all
        Handler handler;
    };

    // Parse a path pattern into segments and parameter flags
    bool parsePathPattern(const std::string &pathPattern, Handler handler, RouteEntry &entry);

    void insertSorted(std::vector<RouteEntry> &entries, RouteEntry entry);

    // Split a path into segments
    static std::vector<std::string> splitPath(const std::string &path);

    // Everything after the first 'count' segments of 'path', one separating
    // '/' removed.
    static std::string remainderAfter(const std::string &path, size_t count);

    // Check if a request path matches a route pattern
    bool matchPath(const RouteEntry &routeEntry,
                   const std::string &requestPath,
                   std::unordered_map<std::string, std::string> &params);

    // Find all methods that support a given path
    std::vector<std::string> findAllowedMethods(const std::string &requestPath);

    // Map of method to list of route entries
    std::unordered_map<std::string, std::vector<RouteEntry>> routes_;
};

}  // namespace datasource
