#pragma once

#include <map>
#include <string>

namespace clinic_voice::utils {

void parse_url(const std::string& url, std::string& scheme, std::string& host,
               int& port, std::string& base_path);

std::string url_encode(const std::string& value);

// Appends key=value pairs, url encoded, to a URL that may already carry a query.
std::string append_query(const std::string& url,
                         const std::map<std::string, std::string>& params);

// Joins a base path and a request path with exactly one slash between them.
std::string join_path(const std::string& base_path, const std::string& path);

}
