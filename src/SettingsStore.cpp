#include "SettingsStore.h"

#include "Logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStandardPaths>

static void setError(QString *errorString, const QString &msg)
{
    if (errorString)
        *errorString = msg;
}

static std::optional<int> jsonInt(const QJsonValue &v)
{
    if (!v.isDouble())
        return std::nullopt;
    const double d = v.toDouble();
    const int i = v.toInt();
    if (static_cast<double>(i) != d)
        return std::nullopt;
    return i;
}

SettingsStore::SettingsStore(const QString &filePath, QObject *parent)
    : QObject(parent)
    , m_path(filePath)
{
}

QString SettingsStore::defaultPath()
{
    const QString base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return QDir(base).filePath(QStringLiteral("settings.json"));
}

bool SettingsStore::load(QString *errorString)
{
    m_values = QJsonObject();

    QFile f(m_path);
    if (!f.exists())
        return true;
    if (!f.open(QIODevice::ReadOnly)) {
        setError(errorString, QStringLiteral("cannot read %1: %2").arg(m_path, f.errorString()));
        return false;
    }

    QJsonParseError parseError;
    const auto doc = QJsonDocument::fromJson(f.readAll(), &parseError);
    f.close();
    QString problem;
    if (parseError.error != QJsonParseError::NoError)
        problem = parseError.errorString();
    else if (!doc.isObject())
        problem = QStringLiteral("top level is not an object");
    if (!problem.isEmpty()) {
        setError(errorString, QStringLiteral("malformed %1: %2; %3").arg(m_path, problem, quarantine()));
        return false;
    }

    m_values = doc.object();
    qCDebug(lcSettings) << "loaded" << m_values.size() << "keys from" << m_path;
    return true;
}

QString SettingsStore::quarantinePath() const
{
    return m_path + QStringLiteral(".bad");
}

QString SettingsStore::quarantine() const
{
    const QString bad = quarantinePath();
    if (QFile::exists(bad) && !QFile::remove(bad))
        return QStringLiteral("cannot replace %1, the next save overwrites the file").arg(bad);
    if (!QFile::rename(m_path, bad))
        return QStringLiteral("cannot move it to %1, the next save overwrites the file").arg(bad);
    qCWarning(lcSettings) << "moved unreadable" << m_path << "to" << bad;
    return QStringLiteral("moved to %1").arg(bad);
}

bool SettingsStore::save(QString *errorString) const
{
    if (!QDir().mkpath(QFileInfo(m_path).absolutePath())) {
        setError(errorString, QStringLiteral("cannot create directory for %1").arg(m_path));
        return false;
    }

    QSaveFile f(m_path);
    if (!f.open(QIODevice::WriteOnly)) {
        setError(errorString, QStringLiteral("cannot write %1: %2").arg(m_path, f.errorString()));
        return false;
    }
    f.write(QJsonDocument(m_values).toJson(QJsonDocument::Indented));
    if (!f.commit()) {
        setError(errorString, QStringLiteral("cannot write %1: %2").arg(m_path, f.errorString()));
        return false;
    }
    return true;
}

void SettingsStore::set(const QString &key, const QJsonValue &value)
{
    m_values.insert(key, value);
}

std::optional<QJsonValue> SettingsStore::get(const QString &key) const
{
    const auto it = m_values.constFind(key);
    if (it == m_values.constEnd())
        return std::nullopt;
    return it.value();
}

bool SettingsStore::remove(const QString &key)
{
    if (!m_values.contains(key))
        return false;
    m_values.remove(key);
    return true;
}

bool SettingsStore::has(const QString &key) const
{
    return m_values.contains(key);
}

QString SettingsStore::customPositionKey(const QString &mode)
{
    return QStringLiteral("custom_position_") + mode;
}

bool SettingsStore::saveCustomPosition(const QString &mode, const QPoint &pos, QString *errorString)
{
    qCInfo(lcSettings) << "save_custom_position: mode=" << mode << "x=" << pos.x() << "y=" << pos.y();
    if (mode.isEmpty()) {
        setError(errorString, QStringLiteral("mode must not be empty"));
        return false;
    }

    QJsonObject o;
    o.insert(QStringLiteral("x"), pos.x());
    o.insert(QStringLiteral("y"), pos.y());
    set(customPositionKey(mode), o);
    if (!save(errorString))
        return false;

    qCInfo(lcSettings) << "Custom position saved for mode:" << mode;
    emit customPositionChanged(mode);
    return true;
}

std::optional<QPoint> SettingsStore::customPosition(const QString &mode, QString *errorString) const
{
    if (mode.isEmpty()) {
        setError(errorString, QStringLiteral("mode must not be empty"));
        return std::nullopt;
    }

    const auto value = get(customPositionKey(mode));
    if (!value) {
        qCDebug(lcSettings) << "No custom position found for mode:" << mode;
        return std::nullopt;
    }

    const QJsonObject o = value->toObject();
    const auto x = jsonInt(o.value(QStringLiteral("x")));
    const auto y = jsonInt(o.value(QStringLiteral("y")));
    if (!value->isObject() || !x || !y) {
        setError(errorString, QStringLiteral("invalid custom position stored for mode %1").arg(mode));
        return std::nullopt;
    }

    qCDebug(lcSettings) << "Custom position found for mode" << mode << ":" << *x << *y;
    return QPoint(*x, *y);
}

bool SettingsStore::clearCustomPosition(const QString &mode, QString *errorString)
{
    qCInfo(lcSettings) << "clear_custom_position: mode=" << mode;
    if (mode.isEmpty()) {
        setError(errorString, QStringLiteral("mode must not be empty"));
        return false;
    }

    remove(customPositionKey(mode));
    if (!save(errorString))
        return false;

    emit customPositionChanged(mode);
    return true;
}

bool SettingsStore::hasCustomPosition(const QString &mode) const
{
    return !mode.isEmpty() && has(customPositionKey(mode));
}
