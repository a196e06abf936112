#include "file_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>

std::string readTextFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть входной файл: " + path.string());
    }

    std::string content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        throw std::runtime_error("Ошибка чтения файла: " + path.string());
    }
    return content;
}

std::string readStream(std::istream& input) {
    std::string content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        throw std::runtime_error("Ошибка чтения входного потока");
    }
    return content;
}

std::filesystem::path findProjectRoot() {
    try {
        std::filesystem::path current = std::filesystem::current_path();

        // Поднимаемся вверх по директориям, пока не найдем папку tests или CMakeLists.txt
        while (!current.empty() && current != current.root_path()) {
            try {
                std::filesystem::path testsDir = current / "tests";
                std::filesystem::path cmakeFile = current / "CMakeLists.txt";

                if (std::filesystem::is_directory(testsDir)) {
                    return current;
                }
                if (std::filesystem::is_regular_file(cmakeFile)) {
                    return current;
                }
            }
            catch (const std::filesystem::filesystem_error&) {
                // Пропускаем директории, к которым нет доступа
            }

            std::filesystem::path parent = current.parent_path();
            if (parent == current) {
                break;
            }
            current = parent;
        }
    }
    catch (const std::filesystem::filesystem_error&) {
        // Ниже вернем текущую директорию
    }

    return std::filesystem::current_path();
}

bool hasExtension(const std::filesystem::path& path, const std::string& ext) {
    std::string pathExt = path.extension().string();
    if (pathExt.empty()) {
        return false;
    }

    std::string lowerExt = ext;
    std::transform(pathExt.begin(), pathExt.end(), pathExt.begin(), ::tolower);
    std::transform(lowerExt.begin(), lowerExt.end(), lowerExt.begin(), ::tolower);

    return pathExt == lowerExt;
}

std::vector<std::filesystem::path> findProgramFiles(const std::filesystem::path& directory) {
    std::vector<std::filesystem::path> files;

    try {
        if (!std::filesystem::is_directory(directory)) {
            return files;
        }

        for (const auto& entry : std::filesystem::directory_iterator(directory)) {
            try {
                if (entry.is_regular_file() &&
                    (hasExtension(entry.path(), ".txt") || hasExtension(entry.path(), ".in"))) {
                    files.push_back(entry.path());
                }
            }
            catch (const std::filesystem::filesystem_error&) {
                // Пропускаем файлы, к которым нет доступа или которые были удалены
                continue;
            }
        }
    }
    catch (const std::filesystem::filesystem_error&) {
        return files;
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::string getCurrentTimeString() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;

#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S");
    return oss.str();
}
