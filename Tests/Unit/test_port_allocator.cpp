#include <QtTest/QtTest>

#include <QHostAddress>
#include <QTcpServer>

#include "core/net/port_allocator.h"

class TestPortAllocator : public QObject {
    Q_OBJECT

private slots:
    void testAllocatedPortIsBindable();
    void testRepeatedAllocationsStayInRange();
};

void TestPortAllocator::testAllocatedPortIsBindable()
{
    const quint16 port = md::PortAllocator::allocate();
    QVERIFY(port > 0);

    // The probe listener is gone by the time allocate() returns.
    QTcpServer server;
    QVERIFY2(server.listen(QHostAddress::LocalHost, port), qPrintable(server.errorString()));
    QCOMPARE(server.serverPort(), port);
}

void TestPortAllocator::testRepeatedAllocationsStayInRange()
{
    for (int i = 0; i < 20; ++i) {
        const quint16 port = md::PortAllocator::allocate();
        QVERIFY(port >= 1024 || port == md::PortAllocator::kFallbackPort);
    }
}

QTEST_MAIN(TestPortAllocator)
#include "test_port_allocator.moc"
