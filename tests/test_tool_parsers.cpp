#include <QtTest/QtTest>

#include <cstdint>
#include <cstring>

#include "probe/tool_parsers.hpp"

using namespace zverify;

class ToolParserTests : public QObject
{
    Q_OBJECT
private slots:
    void testModuleLoaded();
    void testModinfoFields();
    void testUserlandVersion();
    void testPoolList();
    void testCapacityBounds();
    void testDatasetList();
    void testPackageCategories();
    void testPendingUpdates();
    void testHostId();
    void testBlkidDevice();
    void testEfiEntries();
    void testLatestKernel();
    void testPermissionsToMode();
    void testDracutVersion();
    void testMissingConfigSettings();
    void testBootMenuConfig();
    void testPropertyValueAndCounts();
};

void ToolParserTests::testModuleLoaded()
{
    const std::string lsmod =
        "Module                  Size  Used by\n"
        "zfs                  6537216  8\n"
        "spl                   135168  1 zfs\n";
    QCOMPARE(parseModuleLoaded(lsmod, "zfs"), std::optional<bool>(true));
    QCOMPARE(parseModuleLoaded(lsmod, "zfs_core"), std::optional<bool>(false));
    QVERIFY(!parseModuleLoaded("", "zfs").has_value());
}

void ToolParserTests::testModinfoFields()
{
    const std::string modinfo =
        "filename:       /lib/modules/6.6.30_1/extra/zfs/zfs.ko\n"
        "version:        2.2.3-1\n"
        "license:        CDDL\n"
        "vermagic:       6.6.30_1 SMP preempt mod_unload \n";
    QCOMPARE(parseModinfoField(modinfo, "version"), std::string("2.2.3-1"));
    QCOMPARE(parseModinfoField(modinfo, "vermagic"), std::string("6.6.30_1"));
    QCOMPARE(parseModinfoField(modinfo, "srcversion"), std::string(kUnknown));
    QCOMPARE(parseModinfoField("modinfo: ERROR: Module zfs not found.", "version"),
             std::string(kUnknown));
}

void ToolParserTests::testUserlandVersion()
{
    QCOMPARE(parseUserlandVersion("zfs-2.2.3-1\nzfs-kmod-2.2.3-1\n"), std::string("2.2.3-1"));
    QCOMPARE(parseUserlandVersion("zfs-kmod-2.2.3-1\nzfs-2.2.4-1\n"), std::string("2.2.4-1"));
    QCOMPARE(parseUserlandVersion("garbage"), std::string(kUnknown));
}

void ToolParserTests::testPoolList()
{
    const auto pools = parsePoolList("zroot\tONLINE\t41%\ntank\tDEGRADED\t55%\nbad\tWEIRD\t-\n");
    QCOMPARE(pools.size(), static_cast<size_t>(3));
    QCOMPARE(QString::fromStdString(pools[0].name), QStringLiteral("zroot"));
    QCOMPARE(pools[0].health, PoolHealth::Online);
    QCOMPARE(pools[0].capacityPercent, std::optional<int>(41));
    QCOMPARE(pools[1].health, PoolHealth::Degraded);
    QCOMPARE(pools[2].health, PoolHealth::Unknown);
    QVERIFY(!pools[2].capacityPercent.has_value());

    const auto spaced = parsePoolList("data  FAULTED  12%");
    QCOMPARE(spaced.size(), static_cast<size_t>(1));
    QCOMPARE(spaced[0].health, PoolHealth::Faulted);
    QVERIFY(parsePoolList("").empty());
}

void ToolParserTests::testCapacityBounds()
{
    QCOMPARE(parseCapacityPercent("0%"), std::optional<int>(0));
    QCOMPARE(parseCapacityPercent("100%"), std::optional<int>(100));
    QVERIFY(!parseCapacityPercent("101%").has_value());
    QVERIFY(!parseCapacityPercent("-5%").has_value());
    QVERIFY(!parseCapacityPercent("abc").has_value());
}

void ToolParserTests::testDatasetList()
{
    const auto datasets = parseDatasetList(
        "zroot\tno\tnone\ton\n"
        "zroot/ROOT/void\tyes\t/\tnoauto\n"
        "zroot/home\tno\t/home\ton\n"
        "zroot/legacy\tno\tlegacy\ton\n");
    QCOMPARE(datasets.size(), static_cast<size_t>(4));
    QVERIFY(!datasets[0].mountpoint.has_value());
    QVERIFY(datasets[1].mounted);
    QCOMPARE(QString::fromStdString(datasets[1].canMount), QStringLiteral("noauto"));
    QCOMPARE(datasets[2].mountpoint, std::optional<std::string>("/home"));
    QVERIFY(!datasets[2].mounted);
    QVERIFY(!datasets[3].mountpoint.has_value());
}

void ToolParserTests::testPackageCategories()
{
    QCOMPARE(packageNameFromPkgver("linux6.6-6.6.30_1"), std::string("linux6.6"));
    QCOMPARE(packageNameFromPkgver("zfs-2.2.3_1"), std::string("zfs"));
    QCOMPARE(packageNameFromPkgver("linux-headers-6.6_1"), std::string("linux-headers"));
    QCOMPARE(packageNameFromPkgver("zfsbootmenu"), std::string("zfsbootmenu"));

    QCOMPARE(categorizePackage("zfs"), UpdateCategory::Storage);
    QCOMPARE(categorizePackage("zfs-dkms"), UpdateCategory::Storage);
    QCOMPARE(categorizePackage("zfsbootmenu"), UpdateCategory::BootMenu);
    QCOMPARE(categorizePackage("dracut"), UpdateCategory::InitramfsBuilder);
    QCOMPARE(categorizePackage("dracut-network"), UpdateCategory::InitramfsBuilder);
    QCOMPARE(categorizePackage("linux"), UpdateCategory::Kernel);
    QCOMPARE(categorizePackage("linux6.6"), UpdateCategory::Kernel);
    QCOMPARE(categorizePackage("linux-headers"), UpdateCategory::Kernel);
    QCOMPARE(categorizePackage("linux-firmware"), UpdateCategory::Other);
    QCOMPARE(categorizePackage("zstd"), UpdateCategory::Other);
}

void ToolParserTests::testPendingUpdates()
{
    const auto counts = parsePendingUpdates(
        "linux6.6-6.6.31_1 update x86_64 https://repo-default.voidlinux.org/current 1 2\n"
        "zfs-2.2.4_1 update x86_64 https://repo-default.voidlinux.org/current 1 2\n"
        "dracut-103_1 update noarch https://repo-default.voidlinux.org/current 1 2\n"
        "zfsbootmenu-2.3.0_1 update noarch https://repo-default.voidlinux.org/current 1 2\n"
        "firefox-126.0_1 update x86_64 https://repo-default.voidlinux.org/current 1 2\n"
        "\n");
    QCOMPARE(counts.total, 5);
    QCOMPARE(counts.kernel, 1);
    QCOMPARE(counts.storage, 1);
    QCOMPARE(counts.initramfsBuilder, 1);
    QCOMPARE(counts.bootMenu, 1);
    QCOMPARE(counts.other, 1);
    QCOMPARE(counts.packages.size(), static_cast<size_t>(5));
    QCOMPARE(QString::fromStdString(counts.packages.front()),
             QStringLiteral("linux6.6-6.6.31_1"));

    QCOMPARE(parsePendingUpdates("").total, 0);
}

void ToolParserTests::testHostId()
{
    QCOMPARE(parseHostIdCommand("00A8C0DE\n"), std::string("00a8c0de"));
    QCOMPARE(parseHostIdCommand("xyz"), std::string(kUnknown));

    const std::uint32_t value = 0x00a8c0de;
    std::string bytes(sizeof(value), '\0');
    std::memcpy(bytes.data(), &value, sizeof(value));
    QCOMPARE(hostIdFromFileBytes(bytes), std::string("00a8c0de"));
    QCOMPARE(hostIdFromFileBytes("abc"), std::string(kUnknown));
}

void ToolParserTests::testBlkidDevice()
{
    QCOMPARE(parseBlkidVfatDevice(
                 "/dev/loop0: TYPE=\"vfat\"\n"
                 "/dev/nvme0n1p1: UUID=\"ABCD-1234\" TYPE=\"vfat\"\n"),
             std::string("/dev/nvme0n1p1"));
    QCOMPARE(parseBlkidVfatDevice("/dev/loop0: TYPE=\"vfat\""), std::string());
}

void ToolParserTests::testEfiEntries()
{
    QVERIFY(efiEntriesMention("Boot0001* ZFSBootMenu\tHD(1,GPT,...)"));
    QVERIFY(efiEntriesMention("Boot0002* ZBM (Backup)"));
    QVERIFY(!efiEntriesMention("Boot0000* Windows Boot Manager"));
}

void ToolParserTests::testLatestKernel()
{
    QCOMPARE(pickLatestKernel({"vmlinuz-6.6.9_1", "vmlinuz-6.6.30_1", "vmlinuz-6.1.90_1"}),
             std::string("6.6.30_1"));
    QCOMPARE(pickLatestKernel({"vmlinuz-6.9.1_1", "vmlinuz-6.10.2_1"}), std::string("6.10.2_1"));
    QCOMPARE(pickLatestKernel({"config-6.6.30_1"}), std::string(kUnknown));
    QCOMPARE(pickLatestKernel({}), std::string(kUnknown));
}

void ToolParserTests::testPermissionsToMode()
{
    QCOMPARE(permissionsToMode(QFileDevice::ReadOwner | QFileDevice::WriteOwner), 0600);
    QCOMPARE(permissionsToMode(QFileDevice::ReadOwner | QFileDevice::WriteOwner
                               | QFileDevice::ReadGroup | QFileDevice::ReadOther),
             0644);
    QCOMPARE(permissionsToMode(QFileDevice::ReadOwner), 0400);
}

void ToolParserTests::testDracutVersion()
{
    QCOMPARE(QString::fromStdString(parseDracutVersion("dracut 059\n")), QStringLiteral("059"));
    QCOMPARE(QString::fromStdString(parseDracutVersion("103")), QStringLiteral("103"));
    QCOMPARE(QString::fromStdString(parseDracutVersion("")), QString::fromLatin1(kUnknown));
}

void ToolParserTests::testMissingConfigSettings()
{
    const std::string config =
        "hostonly=\"yes\"\n"
        "add_dracutmodules+=\" zfs \"\n"
        "# force_drivers+=\" zfs \"\n"
        "install_items+=\" /etc/hostid /etc/zfs/zroot.key \"\n";
    const std::vector<std::string> required = {
        "add_dracutmodules+=\" zfs \"",
        "install_items+=\" /etc/hostid",
        "force_drivers+=\" zfs",
    };

    const auto missing = missingConfigSettings(config, required);
    QCOMPARE(missing.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(missing.front()), QStringLiteral("force_drivers+=\" zfs"));
    QCOMPARE(missingConfigSettings("", required).size(), required.size());
}

void ToolParserTests::testBootMenuConfig()
{
    QVERIFY(bootMenuConfigLooksValid("Global:\n  ManageImages: true\nComponents:\n  Enabled: false\n"));
    QVERIFY(!bootMenuConfigLooksValid("Components:\n  Enabled: false\n"));
    QVERIFY(!bootMenuConfigLooksValid(""));
}

void ToolParserTests::testPropertyValueAndCounts()
{
    QCOMPARE(QString::fromStdString(parsePropertyValue("/etc/zfs/zpool.cache\n")),
             QStringLiteral("/etc/zfs/zpool.cache"));
    QCOMPARE(QString::fromStdString(parsePropertyValue("-")), QStringLiteral("-"));
    QCOMPARE(QString::fromStdString(parsePropertyValue("")), QString::fromLatin1(kUnknown));

    QCOMPARE(countListedLines("zroot/ROOT/void@install\nzroot/home@daily\n\n"), 2);
    QCOMPARE(countListedLines(""), 0);
}

QTEST_MAIN(ToolParserTests)
#include "test_tool_parsers.moc"
