#include <QtTest/QTest>
#include <cmath>
#include "colorcodec.h"

using rbx::Rgba;

class TestColorCodec : public QObject {
    Q_OBJECT
private slots:
    void toHex() {
        QCOMPARE(rbx::rgbaToHex(1.0f, 0.0f, 0.0f), QString("#FF0000FF"));
        QCOMPARE(rbx::rgbaToHex(0.0f, 0.0f, 0.0f, 0.0f), QString("#00000000"));
        QCOMPARE(rbx::rgbaToHex(0.5f, 0.25f, 0.75f, 1.0f), QString("#8040BFFF"));
        QCOMPARE(rbx::rgbaToHex(Rgba::white()), QString("#FFFFFFFF"));
    }

    void toHexClamps() {
        QCOMPARE(rbx::rgbaToHex(1.5f, -0.2f, 0.0f, 2.0f), QString("#FF0000FF"));
    }

    void fromHexSixDigits() {
        bool ok = false;
        Rgba c = rbx::hexToRgba("#FF8000", &ok);
        QVERIFY(ok);
        QCOMPARE(c.r, 1.0f);
        QCOMPARE(c.g, 128 / 255.0f);
        QCOMPARE(c.b, 0.0f);
        QCOMPARE(c.a, 1.0f);
    }

    void fromHexEightDigits() {
        bool ok = false;
        Rgba c = rbx::hexToRgba("00ff0080", &ok);
        QVERIFY(ok);
        QCOMPARE(c.g, 1.0f);
        QCOMPARE(c.a, 128 / 255.0f);
    }

    void fromHexRejects() {
        const char* bad[] = {"", "#", "#12345", "#1234567", "GG0000", "#12 456", "#123456789"};
        for (const char* s : bad) {
            bool ok = true;
            Rgba c = rbx::hexToRgba(s, &ok);
            QVERIFY2(!ok, s);
            QCOMPARE(c, Rgba::white());
        }
    }

    void roundTripWithinOneStep() {
        const float samples[] = {0.0f, 0.1f, 0.333f, 0.5f, 0.9f, 1.0f};
        for (float r : samples)
            for (float a : samples) {
                Rgba c{r, 1.0f - r, r * 0.5f, a};
                bool ok = false;
                Rgba back = rbx::hexToRgba(rbx::rgbaToHex(c), &ok);
                QVERIFY(ok);
                QVERIFY(std::fabs(back.r - c.r) <= 1.0f / 255.0f);
                QVERIFY(std::fabs(back.g - c.g) <= 1.0f / 255.0f);
                QVERIFY(std::fabs(back.b - c.b) <= 1.0f / 255.0f);
                QVERIFY(std::fabs(back.a - c.a) <= 1.0f / 255.0f);
            }
    }
};

QTEST_MAIN(TestColorCodec)
#include "test_colorcodec.moc"
