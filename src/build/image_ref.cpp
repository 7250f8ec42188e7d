#include "ctxstage/image_ref.hpp"

#include <algorithm>
#include <regex>

namespace ctxstage {

namespace {

const std::regex& image_reference_regex() {
    static const std::string host_and_port = R"(([a-z0-9.-]+(:[0-9]+)?/)?)";
    static const std::string separator = R"((?:\.|_{1,2}|-+))";
    static const std::string component = "[a-z0-9]+(?:" + separator + "[a-z0-9]+)*";
    static const std::string path = component + "(/" + component + ")*";
    static const std::string tag = R"((:[a-zA-Z0-9_.-]+)?)";
    static const std::regex re("^" + host_and_port + path + tag + "$");
    return re;
}

} // namespace

bool is_valid_image_reference(const std::string& reference) {
    return std::regex_match(reference, image_reference_regex());
}

std::string sanitize_image_reference(const std::string& reference) {
    std::string result = reference;
    std::replace(result.begin(), result.end(), ':', '_');
    std::replace(result.begin(), result.end(), '/', '_');
    return result;
}

} // namespace ctxstage
