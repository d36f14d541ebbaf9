/**
 * @file file_utils.cpp
 * @brief Реализация файловых операций
 */

#include "file_utils.hpp"
#include <fstream>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace petrolog::io {

std::string readTextFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Не удалось открыть файл: " + path.string());
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

void atomicWrite(const std::filesystem::path& path, const std::string& content) {
    auto dir = path.parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir);
    }

    auto tmp = path;
    tmp += ".tmp" + std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id()));

    {
        std::ofstream ofs(tmp, std::ios::binary);
        if (!ofs) {
            throw std::runtime_error("Не удалось открыть временный файл для записи: " + tmp.string());
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!ofs) {
            throw std::runtime_error("Ошибка записи во временный файл: " + tmp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw std::runtime_error("Не удалось сохранить файл: " + path.string());
    }
}

} // namespace petrolog::io
