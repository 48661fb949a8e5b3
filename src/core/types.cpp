#include "core/types.hpp"

#include <QDate>
#include <QDateTime>
#include <QRegularExpression>
#include <QTime>
#include <QTimeZone>
#include <QUuid>

#include <algorithm>

namespace tally {

static_assert(sizeof(Uuid) == 16, "Uuid should be 16 bytes");
static_assert(std::is_trivially_copyable_v<Uuid>, "Uuid should be trivially copyable");
static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");

namespace {

// Shape check in front of QDateTime, which is more lenient than RFC 3339
// (it takes "24:00", missing zones and fractions without digits).
const QRegularExpression& rfc3339_shape() {
    static const QRegularExpression re(QStringLiteral(
        "^(\\d{4})-(\\d{2})-(\\d{2})[Tt ](\\d{2}):(\\d{2}):(\\d{2})"
        "(?:\\.(\\d+))?"
        "(?:([Zz])|([+-])(\\d{2}):(\\d{2}))$"));
    return re;
}

QString to_qstring(std::string_view text) {
    return QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
}

} // namespace

std::optional<Uuid> Uuid::parse(std::string_view str) {
    const QString text = to_qstring(str);
    const QUuid uuid = QUuid::fromString(text);
    // fromString() reports failure as the nil UUID, which is also valid input.
    if (uuid.isNull()) {
        QString bare = text;
        if (bare.startsWith(QLatin1Char('{')) && bare.endsWith(QLatin1Char('}'))) {
            bare = bare.mid(1, bare.size() - 2);
        }
        if (bare != QUuid().toString(QUuid::WithoutBraces)) {
            return std::nullopt;
        }
    }

    const QByteArray raw = uuid.toRfc4122();
    Bytes bytes{};
    std::copy_n(reinterpret_cast<const uint8_t*>(raw.constData()), BYTE_SIZE, bytes.begin());
    return Uuid(bytes);
}

std::string Uuid::to_string() const {
    const QByteArray raw(reinterpret_cast<const char*>(bytes_.data()), BYTE_SIZE);
    return QUuid::fromRfc4122(raw).toString(QUuid::WithoutBraces).toStdString();
}

std::optional<Instant> parse_rfc3339(std::string_view text) {
    const auto match = rfc3339_shape().match(to_qstring(text));
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    auto number = [&](int group) { return match.captured(group).toInt(); };

    const QDate date(number(1), number(2), number(3));
    const QTime time(number(4), number(5), number(6));
    if (!date.isValid() || !time.isValid()) {
        return std::nullopt;
    }

    QTimeZone zone = QTimeZone::utc();
    if (match.captured(8).isEmpty()) {
        const int hours = number(10);
        const int minutes = number(11);
        if (hours > 23 || minutes > 59) {
            return std::nullopt;
        }
        const int sign = match.captured(9) == QLatin1String("+") ? 1 : -1;
        zone = QTimeZone(sign * (hours * 3600 + minutes * 60));
        if (!zone.isValid()) {
            return std::nullopt;
        }
    }

    const QDateTime moment(date, time, zone);
    if (!moment.isValid()) {
        return std::nullopt;
    }

    // QDateTime stops at milliseconds; the fraction is kept to the nanosecond.
    int32_t nanos = 0;
    const QString fraction = match.captured(7).left(9);
    if (!fraction.isEmpty()) {
        nanos = fraction.leftJustified(9, QLatin1Char('0')).toInt();
    }

    return Instant{.seconds = moment.toSecsSinceEpoch(), .nanos = nanos};
}

std::optional<Timestamp> Timestamp::from_iso_string(std::string_view text) {
    const auto instant = parse_rfc3339(text);
    if (!instant) return std::nullopt;
    return Timestamp(instant->seconds * 1000 + instant->nanos / 1'000'000);
}

std::string Timestamp::to_iso_string() const {
    return QDateTime::fromMSecsSinceEpoch(millis_, QTimeZone::utc())
        .toString(QStringLiteral("yyyy-MM-dd'T'HH:mm:ss.zzz'Z'"))
        .toStdString();
}

} // namespace tally
