// Persistent settings and their validation.
#include <QFileInfo>
#include <QTemporaryDir>
#include <string>

#include "configmanager.h"
#include "test_helpers.hpp"

namespace {

bool check(bool cond, const std::string &msg) {
    return test_helpers::check("config_unit", cond, msg);
}

bool test_defaults(const QString &dir) {
    ConfigManager manager(dir + "/defaults.ini");
    AppConfig config = manager.loadConfig();
    bool ok = check(config.outputFile == "cleaned_lecture.pdf", "default output file");
    ok &= check(config.hammingThreshold == 8, "default threshold");
    ok &= check(config.hashAlgorithm == HashAlgorithm::PHash && config.hashSize == 8, "default 64-bit pHash");
    ok &= check(config.workerThreads == 0 && !config.numericNamesOnly, "default workers and name filter");
    ok &= check(config.pdfResolution == 100 && !config.reduceFileSize, "default PDF settings");
    ok &= check(ConfigManager::validate(config), "defaults are valid");
    return ok;
}

bool test_round_trip(const QString &dir) {
    const QString file = dir + "/saved.ini";
    AppConfig config;
    config.outputFile = "week3.pdf";
    config.hammingThreshold = 20;
    config.hashAlgorithm = HashAlgorithm::DHash;
    config.hashSize = 16;
    config.workerThreads = 3;
    config.numericNamesOnly = true;
    config.pdfResolution = 150;
    config.reduceFileSize = true;
    config.jpegQuality = 60;
    config.targetHeight = 720;
    bool ok = true;
    {
        ConfigManager writer(file);
        writer.saveConfig(config);
        ok &= check(QFileInfo(writer.settingsFileName()) == QFileInfo(file), "settings file name is the INI path");
    }

    ConfigManager reader(file);
    AppConfig loaded = reader.loadConfig();
    ok &= check(loaded.outputFile == "week3.pdf", "output file persists");
    ok &= check(loaded.hammingThreshold == 20, "threshold persists");
    ok &= check(loaded.hashAlgorithm == HashAlgorithm::DHash && loaded.hashSize == 16, "hash settings persist");
    ok &= check(loaded.workerThreads == 3 && loaded.numericNamesOnly, "collection settings persist");
    ok &= check(loaded.pdfResolution == 150 && loaded.reduceFileSize && loaded.jpegQuality == 60 &&
                    loaded.targetHeight == 720,
                "PDF settings persist");

    PdfOptions options = loaded.pdfOptions();
    ok &= check(options.resolution == 150 && options.reduceFileSize && options.jpegQuality == 60 &&
                    options.targetHeight == 720,
                "pdfOptions mirrors the PDF settings");
    return ok;
}

bool expect_invalid(AppConfig config, const std::string &what) {
    QString error;
    bool ok = check(!ConfigManager::validate(config, &error), what + " is rejected");
    ok &= check(!error.isEmpty(), what + " has a message");
    return ok;
}

bool test_validation() {
    bool ok = true;
    AppConfig config;

    config.hammingThreshold = -1;
    ok &= expect_invalid(config, "negative threshold");

    config = AppConfig();
    config.hashSize = 12;
    ok &= expect_invalid(config, "unsupported hash size");

    config = AppConfig();
    config.hammingThreshold = 65;
    ok &= expect_invalid(config, "threshold above the bit length");
    config.hashSize = 16;
    ok &= check(ConfigManager::validate(config), "same threshold fits a 256-bit hash");

    config = AppConfig();
    config.hammingThreshold = 64;
    ok &= check(ConfigManager::validate(config), "threshold equal to the bit length is allowed");

    config = AppConfig();
    config.workerThreads = -2;
    ok &= expect_invalid(config, "negative worker count");

    config = AppConfig();
    config.pdfResolution = 0;
    ok &= expect_invalid(config, "zero resolution");

    config = AppConfig();
    config.jpegQuality = 101;
    ok &= expect_invalid(config, "JPEG quality above 100");

    config = AppConfig();
    config.targetHeight = -1;
    ok &= expect_invalid(config, "negative page height");

    QString error = "stale";
    ok &= check(ConfigManager::validate(AppConfig(), &error) && error.isEmpty(), "valid config clears the message");
    return ok;
}

bool test_algorithm_names() {
    bool ok = true;
    const HashAlgorithm algorithms[] = {HashAlgorithm::PHash, HashAlgorithm::AHash, HashAlgorithm::DHash};
    for (HashAlgorithm algorithm : algorithms) {
        bool parsed = false;
        ok &= check(ConfigManager::getAlgorithmFromName(ConfigManager::getAlgorithmName(algorithm), &parsed) ==
                        algorithm && parsed,
                    "algorithm name " + ConfigManager::getAlgorithmName(algorithm).toStdString() + " parses back");
    }

    bool parsed = false;
    ok &= check(ConfigManager::getAlgorithmFromName(" DHash ", &parsed) == HashAlgorithm::DHash && parsed,
                "names are trimmed and case-insensitive");
    ok &= check(ConfigManager::getAlgorithmFromName("ssim", &parsed) == HashAlgorithm::PHash && !parsed,
                "unknown name falls back to pHash and reports failure");
    return ok;
}

}  // namespace

int main() {
    QTemporaryDir dir;
    if (!dir.isValid()) {
        std::cerr << "[config_unit] cannot create temporary directory\n";
        return 2;
    }

    bool ok = true;
    ok &= test_defaults(dir.path());
    ok &= test_round_trip(dir.path());
    ok &= test_validation();
    ok &= test_algorithm_names();
    return ok ? 0 : 1;
}
