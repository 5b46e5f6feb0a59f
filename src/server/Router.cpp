#include "contactform/server/Router.hpp"

#include <cctype>
#include <utility>

namespace contactform::server {
namespace {

std::string_view stripTarget(std::string_view target) {
    target = target.substr(0, target.find('?'));
    if (target.size() > 1 && target.back() == '/') {
        target.remove_suffix(1);
    }
    return target;
}

} // namespace

std::string Router::routeKey(std::string_view method, std::string_view path) {
    std::string key;
    key.reserve(method.size() + 1 + path.size());
    for (unsigned char c : method) {
        key.push_back(static_cast<char>(std::toupper(c)));
    }
    key.push_back(' ');
    key.append(stripTarget(path));
    return key;
}

void Router::addRoute(std::string_view method, std::string_view path, Handler handler) {
    routes_[routeKey(method, path)] = std::move(handler);
}

Router::Handler Router::resolve(std::string_view method, std::string_view target) const {
    if (auto it = routes_.find(routeKey(method, target)); it != routes_.end()) {
        return it->second;
    }
    return nullptr;
}

} // namespace contactform::server
