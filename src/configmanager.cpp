#include "configmanager.h"

// Configuration keys
const QString ConfigManager::KEY_OUTPUT_FILE = "outputFile";
const QString ConfigManager::KEY_HAMMING_THRESHOLD = "hammingThreshold";
const QString ConfigManager::KEY_HASH_ALGORITHM = "hashAlgorithm";
const QString ConfigManager::KEY_HASH_SIZE = "hashSize";
const QString ConfigManager::KEY_WORKER_THREADS = "workerThreads";
const QString ConfigManager::KEY_NUMERIC_NAMES_ONLY = "numericNamesOnly";
const QString ConfigManager::KEY_PDF_RESOLUTION = "pdf/resolution";
const QString ConfigManager::KEY_REDUCE_FILE_SIZE = "pdf/reduceFileSize";
const QString ConfigManager::KEY_JPEG_QUALITY = "pdf/jpegQuality";
const QString ConfigManager::KEY_TARGET_HEIGHT = "pdf/targetHeight";

ConfigManager::ConfigManager(QObject *parent)
    : QObject(parent)
{
    // On Linux this is ~/.config/SlidesDedup/SlidesDedup.conf
    m_settings = new QSettings("SlidesDedup", "SlidesDedup", this);
}

ConfigManager::ConfigManager(const QString& settingsFile, QObject *parent)
    : QObject(parent)
{
    m_settings = new QSettings(settingsFile, QSettings::IniFormat, this);
}

AppConfig ConfigManager::loadConfig()
{
    AppConfig config;

    config.outputFile = m_settings->value(KEY_OUTPUT_FILE, config.outputFile).toString();
    config.hammingThreshold = m_settings->value(KEY_HAMMING_THRESHOLD, config.hammingThreshold).toInt();

    QString algorithmName = m_settings->value(KEY_HASH_ALGORITHM, "phash").toString();
    config.hashAlgorithm = getAlgorithmFromName(algorithmName);

    config.hashSize = m_settings->value(KEY_HASH_SIZE, config.hashSize).toInt();
    config.workerThreads = m_settings->value(KEY_WORKER_THREADS, config.workerThreads).toInt();
    config.numericNamesOnly = m_settings->value(KEY_NUMERIC_NAMES_ONLY, config.numericNamesOnly).toBool();

    // Load PDF settings
    config.pdfResolution = m_settings->value(KEY_PDF_RESOLUTION, config.pdfResolution).toInt();
    config.reduceFileSize = m_settings->value(KEY_REDUCE_FILE_SIZE, config.reduceFileSize).toBool();
    config.jpegQuality = m_settings->value(KEY_JPEG_QUALITY, config.jpegQuality).toInt();
    config.targetHeight = m_settings->value(KEY_TARGET_HEIGHT, config.targetHeight).toInt();

    return config;
}

void ConfigManager::saveConfig(const AppConfig& config)
{
    m_settings->setValue(KEY_OUTPUT_FILE, config.outputFile);
    m_settings->setValue(KEY_HAMMING_THRESHOLD, config.hammingThreshold);
    m_settings->setValue(KEY_HASH_ALGORITHM, getAlgorithmName(config.hashAlgorithm));
    m_settings->setValue(KEY_HASH_SIZE, config.hashSize);
    m_settings->setValue(KEY_WORKER_THREADS, config.workerThreads);
    m_settings->setValue(KEY_NUMERIC_NAMES_ONLY, config.numericNamesOnly);

    // Save PDF settings
    m_settings->setValue(KEY_PDF_RESOLUTION, config.pdfResolution);
    m_settings->setValue(KEY_REDUCE_FILE_SIZE, config.reduceFileSize);
    m_settings->setValue(KEY_JPEG_QUALITY, config.jpegQuality);
    m_settings->setValue(KEY_TARGET_HEIGHT, config.targetHeight);

    m_settings->sync();
}

bool ConfigManager::validate(const AppConfig& config, QString* errorMessage)
{
    QString error;

    if (config.hammingThreshold < 0) {
        error = QString("Hamming threshold must not be negative: %1").arg(config.hammingThreshold);
    } else if (!ImageFingerprinter::isSupportedHashSide(config.hashSize)) {
        error = QString("Unsupported hash size: %1 (use 8 or 16)").arg(config.hashSize);
    } else if (config.hammingThreshold > config.hashSize * config.hashSize) {
        error = QString("Hamming threshold %1 exceeds the %2-bit fingerprint length")
                    .arg(config.hammingThreshold).arg(config.hashSize * config.hashSize);
    } else if (config.workerThreads < 0) {
        error = QString("Worker thread count must not be negative: %1").arg(config.workerThreads);
    } else if (config.pdfResolution <= 0) {
        error = QString("PDF resolution must be positive: %1").arg(config.pdfResolution);
    } else if (config.jpegQuality < 1 || config.jpegQuality > 100) {
        error = QString("JPEG quality must be between 1 and 100: %1").arg(config.jpegQuality);
    } else if (config.targetHeight < 0) {
        error = QString("Target page height must not be negative: %1").arg(config.targetHeight);
    }

    if (errorMessage) {
        *errorMessage = error;
    }
    return error.isEmpty();
}

QString ConfigManager::getAlgorithmName(HashAlgorithm algorithm)
{
    switch (algorithm) {
        case HashAlgorithm::PHash:
            return "phash";
        case HashAlgorithm::AHash:
            return "ahash";
        case HashAlgorithm::DHash:
            return "dhash";
        default:
            return "phash";
    }
}

HashAlgorithm ConfigManager::getAlgorithmFromName(const QString& name, bool* ok)
{
    const QString lower = name.trimmed().toLower();
    if (ok) {
        *ok = true;
    }

    if (lower == "phash") {
        return HashAlgorithm::PHash;
    } else if (lower == "ahash") {
        return HashAlgorithm::AHash;
    } else if (lower == "dhash") {
        return HashAlgorithm::DHash;
    } else {
        if (ok) {
            *ok = false;
        }
        return HashAlgorithm::PHash;
    }
}
