#ifndef NATURALSORT_H
#define NATURALSORT_H

#include <QString>
#include <QStringList>
#include <QList>

/**
 * @brief Natural (human) ordering of file names
 *
 * Names are split into alternating text and digit runs. Digit runs compare by
 * numeric value, so "2.jpg" sorts before "10.jpg"; text runs ignore case.
 * Pure functions, no state.
 */
class NaturalSort
{
public:
    /**
     * @brief Natural-order comparator
     * @return true if a sorts before b
     */
    static bool lessThan(const QString& a, const QString& b);

    /**
     * @brief Sort a list in place using lessThan()
     */
    static void sort(QStringList& list);

private:
    struct Token {
        bool isNumber;
        QString text;     // As written in the name
        QString digits;   // Digit runs only: ASCII digits of the same value
    };

    static QList<Token> tokenize(const QString& str);
    static int compareNumbers(const QString& a, const QString& b);
    static int compareTokens(const Token& a, const Token& b, bool exact);
};

#endif // NATURALSORT_H
