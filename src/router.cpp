#include <algorithm>
#include <sstream>

#include "datasource/router.hpp"

namespace datasource {

namespace {

std::string joinMethods(const std::vector<std::string> &methods) {
    std::ostringstream oss;
    for (size_t i = 0; i < methods.size(); ++i) {
        if (i > 0)
            oss << ", ";
        oss << methods[i];
    }
    return oss.str();
}

}  // namespace

bool Router::addRoute(const std::string &method, const std::string &pathPattern, Handler handler) {
    RouteEntry entry;
    if (!parsePathPattern(pathPattern, handler, entry)) {
        return false;
    }

    // If this is a GET route, also add a HEAD route with the same handler
    if (method == "GET") {
        insertSorted(routes_["HEAD"], entry);
    }
    insertSorted(routes_[method], std::move(entry));
    return true;
}

void Router::insertSorted(std::vector<RouteEntry> &entries, RouteEntry entry) {
    entries.push_back(std::move(entry));
    // Sort: routes without catch-all first, then fewer parameters first
    std::stable_sort(entries.begin(), entries.end(), [](const RouteEntry &a, const RouteEntry &b) {
        bool aWild = !a.catchAllName.empty();
        bool bWild = !b.catchAllName.empty();
        if (aWild != bWild) {
            return !aWild;
        }
        auto aParams = std::count(a.isParameter.begin(), a.isParameter.end(), true);
        auto bParams = std::count(b.isParameter.begin(), b.isParameter.end(), true);
        if (aParams != bParams) {
            return aParams < bParams;
        }
        // longer literal prefix wins among catch-alls
        return a.pathSegments.size() > b.pathSegments.size();
    });
}

HandlerResult Router::handle(const Request &req, Reply &rep) {
    // Handle OPTIONS method specially
    if (req.method_ == "OPTIONS") {
        std::vector<std::string> allowedMethods = findAllowedMethods(req.requestPath_);

        if (!allowedMethods.empty()) {
            rep.addHeader("Allow", joinMethods(allowedMethods));
            rep.send(Reply::ok);
            return HandlerResult::Matched;
        } else {
            // Path not found, return 404
            return HandlerResult::NoMatch;
        }
    }

    // Try to match path+method first
    auto methodIt = routes_.find(req.method_);
    if (methodIt != routes_.end()) {
        for (const auto &routeEntry : methodIt->second) {
            std::unordered_map<std::string, std::string> params;
            if (matchPath(routeEntry, req.requestPath_, params)) {
                routeEntry.handler(req, rep, params);
                return HandlerResult::Matched;
            }
        }
    }

    // If not matched, check if path exists for any other method and collect allowed methods
    std::vector<std::string> allowedMethods = findAllowedMethods(req.requestPath_);
    allowedMethods.erase(std::remove(allowedMethods.begin(), allowedMethods.end(), req.method_),
                         allowedMethods.end());

    if (!allowedMethods.empty()) {
        rep.addHeader("Allow", joinMethods(allowedMethods));
        rep.send(Reply::method_not_allowed);
        return HandlerResult::Matched;
    }

    // No path matched at all
    return HandlerResult::NoMatch;
}

std::vector<std::string> Router::findAllowedMethods(const std::string &requestPath) {
    std::vector<std::string> allowedMethods;

    for (const auto &it : routes_) {
        for (const auto &routeEntry : it.second) {
            std::unordered_map<std::string, std::string> params;
            if (matchPath(routeEntry, requestPath, params)) {
                allowedMethods.push_back(it.first);
                break;  // Only need to add each method once
            }
        }
    }

    // unordered_map iteration order is unspecified
    std::sort(allowedMethods.begin(), allowedMethods.end());
    return allowedMethods;
}

bool Router::parsePathPattern(const std::string &pathPattern, Handler handler, RouteEntry &entry) {
    entry.handler = std::move(handler);

    std::vector<std::string> segments = splitPath(pathPattern);

    for (size_t i = 0; i < segments.size(); ++i) {
        const std::string &segment = segments[i];
        if (segment.size() >= 2 && segment.front() == '{' && segment.back() == '}') {
            std::string paramName = segment.substr(1, segment.size() - 2);
            if (!paramName.empty() && paramName.back() == '*') {
                paramName.pop_back();
                if (paramName.empty() || i + 1 != segments.size()) {
                    return false;
                }
                entry.catchAllName = paramName;
                break;
            }
            if (paramName.empty()) {
                return false;
            }
            entry.pathSegments.push_back(paramName);
            entry.isParameter.push_back(true);
            entry.paramNames.push_back(paramName);
        } else {
            // This is a literal segment
            entry.pathSegments.push_back(segment);
            entry.isParameter.push_back(false);
            entry.paramNames.push_back("");  // Empty string for non-parameters
        }
    }

    return true;
}

std::vector<std::string> Router::splitPath(const std::string &path) {
    std::vector<std::string> segments;

    std::stringstream ss(path);
    std::string segment;

    while (std::getline(ss, segment, '/')) {
        if (!segment.empty()) {
            segments.push_back(segment);
        }
    }

    return segments;
}

std::string Router::remainderAfter(const std::string &path, size_t count) {
    size_t pos = 0;
    for (size_t i = 0; i < count; ++i) {
        pos = path.find_first_not_of('/', pos);
        if (pos == std::string::npos) {
            return "";
        }
        pos = path.find('/', pos);
        if (pos == std::string::npos) {
            return "";
        }
    }

    if (count == 0) {
        // the leading '/' of an absolute path
        return (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    }
    return path.substr(pos + 1);
}

bool Router::matchPath(const RouteEntry &routeEntry,
                       const std::string &requestPath,
                       std::unordered_map<std::string, std::string> &params) {
    std::vector<std::string> requestSegments = splitPath(requestPath);
    const bool hasCatchAll = !routeEntry.catchAllName.empty();

    if (hasCatchAll ? requestSegments.size() < routeEntry.pathSegments.size()
                    : requestSegments.size() != routeEntry.pathSegments.size()) {
        return false;
    }

    // Check each segment
    for (size_t i = 0; i < routeEntry.pathSegments.size(); ++i) {
        if (routeEntry.isParameter[i]) {
            // This is a parameter, extract it
            params[routeEntry.paramNames[i]] = requestSegments[i];
        } else {
            // This is a literal segment, must match exactly
            if (routeEntry.pathSegments[i] != requestSegments[i]) {
                return false;
            }
        }
    }

    if (hasCatchAll) {
        params[routeEntry.catchAllName] =
            remainderAfter(requestPath, routeEntry.pathSegments.size());
    }

    return true;
}

}  // namespace datasource
