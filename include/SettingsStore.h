#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <QObject>
#include <QPoint>
#include <QString>

#include <optional>

// JSON key-value store backed by one file. Mutations stay in memory until save().
class SettingsStore final : public QObject
{
    Q_OBJECT
public:
    explicit SettingsStore(const QString &filePath, QObject *parent = nullptr);

    static QString defaultPath();

    QString filePath() const { return m_path; }

    // A missing file is an empty store. Unreadable or malformed content is an
    // error and leaves the store empty; a malformed file is renamed to
    // quarantinePath() so later saves do not overwrite it.
    bool load(QString *errorString = nullptr);
    QString quarantinePath() const;
    bool save(QString *errorString = nullptr) const;

    void set(const QString &key, const QJsonValue &value);
    std::optional<QJsonValue> get(const QString &key) const;
    bool remove(const QString &key);
    bool has(const QString &key) const;

    // Custom panel positions keyed by placement mode name ("collapsed",
    // "sidepanel_left", "top", ...). Each write is followed by save().
    bool saveCustomPosition(const QString &mode, const QPoint &pos, QString *errorString = nullptr);
    std::optional<QPoint> customPosition(const QString &mode, QString *errorString = nullptr) const;
    bool clearCustomPosition(const QString &mode, QString *errorString = nullptr);
    bool hasCustomPosition(const QString &mode) const;

    static QString customPositionKey(const QString &mode);

signals:
    void customPositionChanged(const QString &mode);

private:
    QString quarantine() const;

    QString m_path;
    QJsonObject m_values;
};
