#ifndef CONFIGMANAGER_H
#define CONFIGMANAGER_H

#include <QObject>
#include <QSettings>
#include <QString>
#include "imagefingerprinter.h"
#include "pdfassembler.h"

struct AppConfig {
    QString outputFile;
    int hammingThreshold;
    HashAlgorithm hashAlgorithm;
    int hashSize;
    int workerThreads;
    bool numericNamesOnly;

    // PDF settings
    int pdfResolution;
    bool reduceFileSize;
    int jpegQuality;
    int targetHeight;

    // Default values
    AppConfig() :
        outputFile("cleaned_lecture.pdf"),
        hammingThreshold(8),
        hashAlgorithm(HashAlgorithm::PHash),
        hashSize(8),
        workerThreads(0),
        numericNamesOnly(false),
        pdfResolution(100),
        reduceFileSize(false),
        jpegQuality(75),
        targetHeight(0)
    {}

    PdfOptions pdfOptions() const
    {
        PdfOptions options;
        options.resolution = pdfResolution;
        options.reduceFileSize = reduceFileSize;
        options.jpegQuality = jpegQuality;
        options.targetHeight = targetHeight;
        return options;
    }
};

class ConfigManager : public QObject
{
    Q_OBJECT

public:
    explicit ConfigManager(QObject *parent = nullptr);

    /**
     * Use an INI file instead of the platform settings store
     * @param settingsFile Path of the INI file
     * @param parent Parent object
     */
    explicit ConfigManager(const QString& settingsFile, QObject *parent = nullptr);

    /**
     * Load configuration from persistent storage
     * @return AppConfig structure with loaded settings
     */
    AppConfig loadConfig();

    /**
     * Save configuration to persistent storage
     * @param config Configuration to save
     */
    void saveConfig(const AppConfig& config);

    /**
     * Check a configuration before a run
     * @param config Configuration to check
     * @param errorMessage Set to the first problem found
     * @return true if the configuration can be used
     */
    static bool validate(const AppConfig& config, QString* errorMessage = nullptr);

    /**
     * Get algorithm name as string
     * @param algorithm Hash algorithm
     * @return "phash", "ahash" or "dhash"
     */
    static QString getAlgorithmName(HashAlgorithm algorithm);

    /**
     * Get algorithm from string name (case-insensitive)
     * @param name Algorithm name
     * @param ok Set to false for an unknown name, which maps to PHash
     * @return Hash algorithm
     */
    static HashAlgorithm getAlgorithmFromName(const QString& name, bool* ok = nullptr);

    QString settingsFileName() const { return m_settings->fileName(); }

private:
    QSettings* m_settings;

    // Configuration keys
    static const QString KEY_OUTPUT_FILE;
    static const QString KEY_HAMMING_THRESHOLD;
    static const QString KEY_HASH_ALGORITHM;
    static const QString KEY_HASH_SIZE;
    static const QString KEY_WORKER_THREADS;
    static const QString KEY_NUMERIC_NAMES_ONLY;
    static const QString KEY_PDF_RESOLUTION;
    static const QString KEY_REDUCE_FILE_SIZE;
    static const QString KEY_JPEG_QUALITY;
    static const QString KEY_TARGET_HEIGHT;
};

#endif // CONFIGMANAGER_H
