#include "naturalsort.h"
#include <algorithm>
#include <initializer_list>

QList<NaturalSort::Token> NaturalSort::tokenize(const QString& str)
{
    QList<Token> tokens;
    QString currentText;
    int i = 0;

    while (i < str.length()) {
        if (str.at(i).isDigit()) {
            // Flush current text
            if (!currentText.isEmpty()) {
                tokens.append(Token{false, currentText, QString()});
                currentText.clear();
            }

            // Extract full number; digits of any script map to their ASCII value
            QString numStr;
            QString digits;
            while (i < str.length() && str.at(i).isDigit()) {
                numStr += str.at(i);
                digits += QChar('0' + str.at(i).digitValue());
                ++i;
            }
            tokens.append(Token{true, numStr, digits});
            continue;
        }

        currentText += str.at(i);
        ++i;
    }

    // Flush remaining text
    if (!currentText.isEmpty()) {
        tokens.append(Token{false, currentText, QString()});
    }

    return tokens;
}

int NaturalSort::compareNumbers(const QString& a, const QString& b)
{
    // Digit runs can exceed any integer type, so compare them as strings
    // once leading zeros are gone: a longer run is a larger number.
    int startA = 0;
    while (startA < a.length() - 1 && a.at(startA) == QChar('0')) {
        ++startA;
    }
    int startB = 0;
    while (startB < b.length() - 1 && b.at(startB) == QChar('0')) {
        ++startB;
    }

    const QString digitsA = a.mid(startA);
    const QString digitsB = b.mid(startB);

    if (digitsA.length() != digitsB.length()) {
        return digitsA.length() < digitsB.length() ? -1 : 1;
    }
    return QString::compare(digitsA, digitsB);
}

int NaturalSort::compareTokens(const Token& a, const Token& b, bool exact)
{
    if (a.isNumber && b.isNumber) {
        if (exact) {
            // Same value: "7" before "007", then ASCII before other scripts
            if (a.digits.length() != b.digits.length()) {
                return a.digits.length() < b.digits.length() ? -1 : 1;
            }
            return QString::compare(a.text, b.text);
        }
        return compareNumbers(a.digits, b.digits);
    }

    if (!a.isNumber && !b.isNumber) {
        return QString::compare(a.text, b.text, exact ? Qt::CaseSensitive : Qt::CaseInsensitive);
    }

    // Mixed types - numbers come before strings
    return a.isNumber ? -1 : 1;
}

bool NaturalSort::lessThan(const QString& a, const QString& b)
{
    QList<Token> tokensA = tokenize(a);
    QList<Token> tokensB = tokenize(b);

    int len = qMin(tokensA.size(), tokensB.size());

    // Numeric value and case-insensitive text decide first; leading zeros
    // and letter case only break ties between otherwise equal names.
    for (bool exact : {false, true}) {
        for (int i = 0; i < len; ++i) {
            int cmp = compareTokens(tokensA[i], tokensB[i], exact);
            if (cmp != 0) {
                return cmp < 0;
            }
        }
        if (!exact && tokensA.size() != tokensB.size()) {
            break;
        }
    }

    // All compared elements are equal, shorter list comes first
    return tokensA.size() < tokensB.size();
}

void NaturalSort::sort(QStringList& list)
{
    std::stable_sort(list.begin(), list.end(), lessThan);
}
