#include "gateway_setup/common/secure_file.hpp"
#include "gateway_setup/common/logger.hpp"
#include <filesystem>
#include <fstream>
#include <sys/stat.h>

namespace gateway_setup {
namespace common {

namespace fs = std::filesystem;

static ExportResult failure(SetupErrorCode code, const std::string& path, const std::string& detail) {
    ExportResult result;
    result.success = false;
    result.path = path;
    result.error = code;
    result.detail = detail;

    ErrorContext ctx{"SecureFile", {{"path", path}, {"detail", detail}}};
    Logger::instance().error("{}", formatError(code, ctx));
    return result;
}

ExportResult writeSecureJson(const std::string& path, const nlohmann::json& data) {
    std::error_code ec;
    fs::path file_path = fs::absolute(path, ec);
    if (ec) {
        return failure(SetupErrorCode::EXPORT_DIRECTORY_FAILED, path, ec.message());
    }

    // Only a directory created here is restricted; an existing one keeps its mode.
    fs::path dir = file_path.parent_path();
    if (!fs::exists(dir, ec)) {
        if (!fs::create_directories(dir, ec) && ec) {
            return failure(SetupErrorCode::EXPORT_DIRECTORY_FAILED, file_path.string(), ec.message());
        }
        fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
        if (ec) {
            Logger::instance().warn("[SecureFile] Could not restrict directory | path={} | error={}",
                                    dir.string(), ec.message());
            ec.clear();
        }
    }

    std::string tmp_path = file_path.string() + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::out | std::ios::trunc);
        if (!file) {
            return failure(SetupErrorCode::EXPORT_WRITE_FAILED, file_path.string(), "cannot open " + tmp_path);
        }
        if (chmod(tmp_path.c_str(), S_IRUSR | S_IWUSR) != 0) {
            file.close();
            fs::remove(tmp_path, ec);
            return failure(SetupErrorCode::EXPORT_WRITE_FAILED, file_path.string(), "cannot restrict " + tmp_path);
        }

        file << data.dump(2);
        file.close();
        if (!file) {
            fs::remove(tmp_path, ec);
            return failure(SetupErrorCode::EXPORT_WRITE_FAILED, file_path.string(), "write to " + tmp_path + " failed");
        }
    }

    fs::rename(tmp_path, file_path, ec);
    if (ec) {
        std::string detail = ec.message();
        fs::remove(tmp_path, ec);
        return failure(SetupErrorCode::EXPORT_WRITE_FAILED, file_path.string(), detail);
    }

    Logger::instance().info("[SecureFile] Exported | path={}", file_path.string());

    ExportResult result;
    result.success = true;
    result.path = file_path.string();
    return result;
}

}}
