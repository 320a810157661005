// FileUtil.h — Чтение и атомарная запись файлов состояния (внутренний заголовок)

#pragma once

#include <string>
#include <optional>

namespace CosmicConnect {
namespace FileUtil {

/// Прочитать файл целиком
/// @return nullopt если файл отсутствует или не читается
std::optional<std::string> readFile(const std::string& path);

/// Записать через временный файл + rename
/// @param privateMode права 0600 вместо 0644
/// @return false при ошибке (сообщение в error)
bool writeFileAtomic(const std::string& path, const std::string& data,
                     bool privateMode, std::string* error = nullptr);

/// Создать директорию со всеми родителями
bool ensureDirectory(const std::string& path, std::string* error = nullptr);

/// Соединить директорию и имя файла
std::string joinPath(const std::string& dir, const std::string& name);

} // namespace FileUtil
} // namespace CosmicConnect
