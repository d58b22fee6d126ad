// =====================================================================
//  src/libtakeoff/measure/parsing.cpp — Distance text parsing
// =====================================================================
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <takeoff/measure/parsing.h>

#include <QRegularExpression>
#include <QRegularExpressionMatch>

namespace takeoff {
namespace measure {

namespace {

// Unsigned decimal number
const QString NUM = QStringLiteral("(\\d+(?:\\.\\d+)?|\\.\\d+)");

// Foot and inch marks, including typographic primes and quotes
const QString FOOT_MARK = QStringLiteral("['\\x{2019}\\x{2032}]");
const QString INCH_MARK = QStringLiteral("(?:\"|''|\\x{201D}|\\x{2033})");

ParsedDistance invalidDistance(const QString& message)
{
    ParsedDistance result;
    result.error = message;
    return result;
}

// Inch counts of 12 or more carry into feet ("11-12" is 12 ft)
ParsedDistance feetAndInches(double feet, double inches, DistanceFormat format)
{
    ParsedDistance result;
    result.valid = true;
    result.value = feet + inches / 12.0;
    result.format = format;
    return result;
}

}  // anonymous namespace

// =====================================================================
//  Distance Parsing
// =====================================================================

ParsedDistance parseDistance(const QString& text)
{
    static const QRegularExpression decimalRe(
        QStringLiteral("^[+-]?(?:\\d+(?:\\.\\d*)?|\\.\\d+)$"));
    static const QRegularExpression markRe(
        QStringLiteral("^") + NUM + QStringLiteral("\\s*") + FOOT_MARK +
        QStringLiteral("\\s*-?\\s*(?:") + NUM + QStringLiteral("\\s*") +
        INCH_MARK + QStringLiteral("?)?$"));
    static const QRegularExpression inchRe(
        QStringLiteral("^") + NUM + QStringLiteral("\\s*") + INCH_MARK +
        QStringLiteral("$"));
    static const QRegularExpression dashRe(
        QStringLiteral("^") + NUM + QStringLiteral("\\s*-\\s*") + NUM +
        QStringLiteral("$"));
    static const QRegularExpression spaceRe(
        QStringLiteral("^") + NUM + QStringLiteral("\\s+") + NUM +
        QStringLiteral("$"));

    QString input = text.trimmed();

    if (input.isEmpty()) {
        return invalidDistance(QStringLiteral("Enter a distance"));
    }

    // Plain decimal first, so "11.33" is never split into feet/inches
    if (decimalRe.match(input).hasMatch()) {
        bool ok = false;
        double value = input.toDouble(&ok);
        if (!ok) {
            return invalidDistance(
                QStringLiteral("Not a number: \"%1\"").arg(input));
        }
        ParsedDistance result;
        result.valid = true;
        result.value = value;
        result.format = DistanceFormat::Decimal;
        return result;
    }

    QRegularExpressionMatch m = markRe.match(input);
    if (m.hasMatch()) {
        double feet = m.captured(1).toDouble();
        double inches = m.captured(2).isEmpty() ? 0.0 : m.captured(2).toDouble();
        return feetAndInches(feet, inches, DistanceFormat::FeetInchesMark);
    }

    m = inchRe.match(input);
    if (m.hasMatch()) {
        ParsedDistance result;
        result.valid = true;
        result.value = m.captured(1).toDouble() / 12.0;
        result.format = DistanceFormat::InchesMark;
        return result;
    }

    m = dashRe.match(input);
    if (m.hasMatch()) {
        return feetAndInches(m.captured(1).toDouble(), m.captured(2).toDouble(),
                             DistanceFormat::FeetInchesDash);
    }

    m = spaceRe.match(input);
    if (m.hasMatch()) {
        return feetAndInches(m.captured(1).toDouble(), m.captured(2).toDouble(),
                             DistanceFormat::FeetInchesSpace);
    }

    return invalidDistance(
        QStringLiteral("Unrecognized distance \"%1\". "
                       "Use 11.33, 11'4\", 11-4 or 11 4").arg(input));
}

// =====================================================================
//  Drawing Scale Parsing
// =====================================================================

bool parseInchQuantity(const QString& text, double& inches)
{
    static const QRegularExpression decimalRe(
        QStringLiteral("^(\\d+(?:\\.\\d+)?|\\.\\d+)$"));
    static const QRegularExpression fractionRe(
        QStringLiteral("^(\\d+)\\s*/\\s*(\\d+)$"));
    static const QRegularExpression mixedRe(
        QStringLiteral("^(\\d+)(?:\\s+|\\s*-\\s*)(\\d+)\\s*/\\s*(\\d+)$"));

    QString input = text.trimmed();

    QRegularExpressionMatch m = decimalRe.match(input);
    if (m.hasMatch()) {
        inches = m.captured(1).toDouble();
        return true;
    }

    m = fractionRe.match(input);
    if (m.hasMatch()) {
        double den = m.captured(2).toDouble();
        if (den == 0.0) return false;
        inches = m.captured(1).toDouble() / den;
        return true;
    }

    m = mixedRe.match(input);
    if (m.hasMatch()) {
        double den = m.captured(3).toDouble();
        if (den == 0.0) return false;
        inches = m.captured(1).toDouble() + m.captured(2).toDouble() / den;
        return true;
    }

    return false;
}

ParsedDrawingScale parseDrawingScale(const QString& text)
{
    static const QRegularExpression ratioRe(
        QStringLiteral("^(\\d+(?:\\.\\d+)?)\\s*:\\s*(\\d+(?:\\.\\d+)?)$"));
    static const QRegularExpression archRe(
        QStringLiteral("^(.+?)\\s*") + INCH_MARK + QStringLiteral("\\s*=\\s*(.+)$"));

    ParsedDrawingScale result;
    QString input = text.trimmed();

    QRegularExpressionMatch m = ratioRe.match(input);
    if (m.hasMatch()) {
        double paper = m.captured(1).toDouble();
        double real = m.captured(2).toDouble();
        if (paper <= 0.0 || real <= 0.0) {
            result.error = QStringLiteral("Scale ratio must be positive");
            return result;
        }
        // 1:48 means one paper unit per 48 real units
        result.valid = true;
        result.inchesPerFoot = 12.0 * paper / real;
        return result;
    }

    m = archRe.match(input);
    if (m.hasMatch()) {
        double paperInches = 0.0;
        if (!parseInchQuantity(m.captured(1), paperInches)) {
            result.error = QStringLiteral("Unrecognized paper length \"%1\"")
                               .arg(m.captured(1));
            return result;
        }

        ParsedDistance real = parseDistance(m.captured(2));
        if (!real.valid) {
            result.error = real.error;
            return result;
        }
        if (real.format == DistanceFormat::InchesMark) {
            result.error = QStringLiteral("Real-world length must be in feet");
            return result;
        }
        if (paperInches <= 0.0 || real.value <= 0.0) {
            result.error = QStringLiteral("Scale lengths must be positive");
            return result;
        }

        result.valid = true;
        result.inchesPerFoot = paperInches / real.value;
        return result;
    }

    result.error = QStringLiteral("Unrecognized drawing scale \"%1\". "
                                  "Use 1/4\" = 1' or 1:48").arg(input);
    return result;
}

double pixelsPerFootFromDrawingScale(double inchesPerFoot, double dpi)
{
    if (inchesPerFoot <= 0.0 || dpi <= 0.0) return 0.0;
    return inchesPerFoot * dpi;
}

// =====================================================================
//  Coordinate Parsing
// =====================================================================

std::optional<QPointF> parsePoint(const QString& text)
{
    QStringList parts = text.split(QLatin1Char(','));
    if (parts.size() != 2) return std::nullopt;

    bool okX = false, okY = false;
    double x = parts[0].trimmed().toDouble(&okX);
    double y = parts[1].trimmed().toDouble(&okY);
    if (!okX || !okY) return std::nullopt;

    return QPointF(x, y);
}

std::optional<geometry::VertexSequence> parsePointList(const QStringList& tokens)
{
    geometry::VertexSequence points;

    for (const QString& token : tokens) {
        const QStringList items = token.split(QLatin1Char(';'), Qt::SkipEmptyParts);
        for (const QString& item : items) {
            std::optional<QPointF> p = parsePoint(item);
            if (!p) return std::nullopt;
            points.append(*p);
        }
    }

    return points;
}

}  // namespace measure
}  // namespace takeoff
