#include "result_store.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace valucalc {

namespace {

constexpr const char* BUNDLE_EXTENSION = ".json";

std::string make_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%dT%H%M%S");
    oss << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

bool valid_id(const std::string& id) {
    return !id.empty() && std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_';
    });
}

} // anonymous namespace

JsonFileResultStore::JsonFileResultStore(std::string directory)
    : directory_(std::move(directory)) {}

std::string JsonFileResultStore::path_for(const std::string& id) const {
    return (fs::path(directory_) / (id + BUNDLE_EXTENSION)).string();
}

std::string JsonFileResultStore::save(const nlohmann::json& bundle) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw DataError("Cannot create result directory " + directory_ + ": " + ec.message());
    }

    std::string id;
    do {
        std::ostringstream oss;
        oss << make_timestamp() << "-" << std::setfill('0') << std::setw(4) << sequence_++;
        id = oss.str();
    } while (fs::exists(path_for(id)));

    std::ofstream file(path_for(id));
    if (!file) {
        throw DataError("Failed to open result file: " + path_for(id));
    }
    file << bundle.dump(2) << "\n";
    if (!file) {
        throw DataError("Failed to write result file: " + path_for(id));
    }
    return id;
}

std::optional<nlohmann::json> JsonFileResultStore::load(const std::string& id) const {
    if (!valid_id(id)) {
        return std::nullopt;
    }
    std::ifstream file(path_for(id));
    if (!file.is_open()) {
        return std::nullopt;
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw DataError("Stored result " + id + " is not valid JSON: " + e.what());
    }
}

std::vector<std::string> JsonFileResultStore::list() const {
    std::vector<std::string> ids;
    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        return ids;
    }
    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == BUNDLE_EXTENSION) {
            ids.push_back(entry.path().stem().string());
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace valucalc
