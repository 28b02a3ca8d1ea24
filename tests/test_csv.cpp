
//    --------------------------------------------------------------------
//
//    This file is part of Vitaline.
//
//    Vitaline is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    Vitaline is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with Vitaline. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------


#include "tests/test_util.h"

#include <cstdio>

// =============================================================================
// Field handling
// =============================================================================

class CsvFieldTests : public VitalineTest {};

TEST_F(CsvFieldTests, SplitHonoursQuotes) {
    std::vector<std::string> f = csv::split("a,\"b,c\",\"say \"\"hi\"\"\",");
    ASSERT_EQ(f.size(), 4u);
    EXPECT_EQ(f[0], "a");
    EXPECT_EQ(f[1], "b,c");
    EXPECT_EQ(f[2], "say \"hi\"");
    EXPECT_EQ(f[3], "");

    std::vector<std::string> t = csv::split("Time\tHR", '\t');
    ASSERT_EQ(t.size(), 2u);
    EXPECT_EQ(t[1], "HR");
}

TEST_F(CsvFieldTests, EscapeOnlyWhenNeeded) {
    EXPECT_EQ(csv::escape("NBP (Sys)"), "NBP (Sys)");
    EXPECT_EQ(csv::escape("a,b"), "\"a,b\"");
    EXPECT_EQ(csv::escape("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(csv::escape("two\nlines"), "\"two\nlines\"");
    EXPECT_EQ(csv::escape("a,b", '\t'), "a,b");
    EXPECT_EQ(csv::escape("a\tb", '\t'), "\"a\tb\"");
}

TEST_F(CsvFieldTests, PrecisionByLabel) {
    EXPECT_EQ(csv::format_value(72.5, "HR"), "73");
    EXPECT_EQ(csv::format_value(97.4, "SpO2"), "97");
    EXPECT_EQ(csv::format_value(13.5, "awRR"), "14");
    EXPECT_EQ(csv::format_value(41, "BIS"), "41");
    EXPECT_EQ(csv::format_value(0.456, "MAC"), "0.46");
    EXPECT_EQ(csv::format_value(35, "etCO2"), "35.0");
    EXPECT_EQ(csv::format_value(120.04, "NBP (Sys)"), "120.0");
    EXPECT_EQ(csv::format_value(-2.5, "HR"), "-2");
    // label match is case-sensitive
    EXPECT_EQ(csv::format_value(72, "hr"), "72.0");
}

TEST_F(CsvFieldTests, TimeColumnPriority) {
    EXPECT_EQ(csv::time_column({ "HR", "RelativeTimeMilliseconds", "Time" }), 2);
    EXPECT_EQ(csv::time_column({ "RelativeTimeMilliseconds", "HR" }), 0);
    EXPECT_EQ(csv::time_column({ "HR", "Milliseconds" }), 1);
    EXPECT_EQ(csv::time_column({ "HR", "ElapsedMilliseconds" }), 1);
    EXPECT_EQ(csv::time_column({ "NBP (Time Remaining)", "Timestamp" }), 1);
    EXPECT_EQ(csv::time_column({ "NBP (Time Remaining)", "HR" }), -1);
    EXPECT_EQ(csv::time_column({ "HR", "SpO2" }), -1);
}

TEST_F(CsvFieldTests, ReadDetectsTabsAndBom) {
    csv_table_t table;
    std::string errmsg;
    ASSERT_TRUE(csv::read(text_lines("\xEF\xBB\xBFTime\tHR\n0\t80\n\n1000\t90\t99\n"), &table, &errmsg));
    EXPECT_EQ(table.delim, '\t');
    ASSERT_EQ(table.header.size(), 2u);
    EXPECT_EQ(table.header[0], "Time");
    ASSERT_EQ(table.rows.size(), 2u);
    EXPECT_EQ(table.rows[1].size(), 2u);

    EXPECT_FALSE(csv::read(text_lines(""), &table, &errmsg));
    EXPECT_EQ(errmsg, "file is empty");
}

// =============================================================================
// Export
// =============================================================================

class CsvExportTests : public VitalineTest {
protected:
    void SetUp() override {
        VitalineTest::SetUp();
        globals::default_duration = 120;
    }

    std::vector<std::string> default_columns(const store_t & store) {
        std::vector<std::string> cols = signal_registry_t::required_columns();
        std::vector<signal_key_t> v = store.timeline().visible();
        for (size_t i = 0; i < v.size(); i++)
            cols.push_back(signal_registry_t::label(v[i]));
        return cols;
    }
};

TEST_F(CsvExportTests, DefaultScenarioFirstRow) {
    store_t store;
    store.select_signals(signal_registry_t::default_active());

    const std::vector<std::string> cols = default_columns(store);
    std::vector<row_t> rows = store.export_rows(cols);
    ASSERT_EQ(rows.size(), 121u);

    const std::vector<std::string> expected = { "00:00:00_000", "0", "0:00", "70", "98", "14", "35.0" };
    ASSERT_EQ(rows[0].size(), expected.size());
    for (size_t c = 0; c < expected.size(); c++) {
        ASSERT_TRUE(rows[0][c].has_value());
        EXPECT_EQ(*rows[0][c], expected[c]);
    }

    EXPECT_EQ(*rows[120][0], "00:02:00_000");
    EXPECT_EQ(*rows[120][1], "120000");

    const std::string text = csv::to_csv(cols, rows);
    std::vector<std::string> lines = text_lines(text);
    ASSERT_EQ(lines.size(), 122u);
    EXPECT_EQ(lines[0], "Time,RelativeTimeMilliseconds,Clock,HR,SpO2,RR,etCO2");
    EXPECT_EQ(lines[1], "00:00:00_000,0,0:00,70,98,14,35.0");
    EXPECT_EQ(text[text.size() - 1], '\n');
}

TEST_F(CsvExportTests, HiddenAndUnknownColumnsAreEmpty) {
    store_t store;
    store.select_signals({ SIG_HR, SIG_SPO2 });
    store.toggle_visibility(SIG_HR);

    std::vector<row_t> rows = store.export_rows({ "Time", "HR", "Perf", "SpO2" });
    EXPECT_FALSE(rows[5][1].has_value());
    EXPECT_FALSE(rows[5][2].has_value());
    EXPECT_EQ(*rows[5][3], "98");

    EXPECT_EQ(csv::to_csv({ "Time", "HR", "Perf", "SpO2" }, rows).substr(0, 46),
              "Time,HR,Perf,SpO2\n00:00:00_000,,,98\n00:00:01_0");
}

TEST_F(CsvExportTests, FullCatalog) {
    store_t store;
    store.select_signals(signal_registry_t::default_active());
    const std::vector<std::string> & cols = signal_registry_t::headers();
    ASSERT_EQ(cols.size(), 53u);
    std::vector<row_t> rows = store.export_rows(cols);
    for (size_t c = 0; c < cols.size(); c++) {
        if (cols[c] == "HR") EXPECT_EQ(*rows[0][c], "70");
        else if (cols[c] == "Pulse") EXPECT_FALSE(rows[0][c].has_value());
        else if (cols[c] == "NBP (Sys)") EXPECT_FALSE(rows[0][c].has_value());
    }
}

TEST_F(CsvExportTests, ClockWrapsAtMidnight) {
    globals::clock_start = "23:59";
    store_t store;
    store.select_signals({ SIG_HR });
    std::vector<row_t> rows = store.export_rows({ "Clock" });
    EXPECT_EQ(*rows[0][0], "23:59");
    EXPECT_EQ(*rows[59][0], "23:59");
    EXPECT_EQ(*rows[60][0], "0:00");
    EXPECT_EQ(*rows[120][0], "0:01");
}

TEST_F(CsvExportTests, ExportedValuesAreRounded) {
    store_t store;
    store.select_signals({ SIG_HR, SIG_ETCO2 });
    store.add_control_point(SIG_HR, 0, 60);
    store.add_control_point(SIG_HR, 3000, 61);
    store.add_control_point(SIG_ETCO2, 0, 30);
    store.add_control_point(SIG_ETCO2, 3000, 31);
    std::vector<row_t> rows = store.export_rows({ "HR", "etCO2" });
    EXPECT_EQ(*rows[1][0], "60");
    EXPECT_EQ(*rows[2][0], "61");
    EXPECT_EQ(*rows[1][1], "30.3");
    EXPECT_EQ(*rows[2][1], "30.7");
}

// =============================================================================
// Import
// =============================================================================

class CsvImportTests : public VitalineTest {
protected:
    void SetUp() override {
        VitalineTest::SetUp();
        globals::default_duration = 120;
    }

    bool import_text(store_t & store, const std::string & text, std::string * errmsg) {
        csv_table_t table;
        if (!csv::read(text_lines(text), &table, errmsg)) return false;
        return store.import_csv(table, errmsg);
    }

    std::string export_text(const store_t & store) {
        std::vector<std::string> cols = signal_registry_t::required_columns();
        std::vector<signal_key_t> v = store.timeline().visible();
        for (size_t i = 0; i < v.size(); i++)
            cols.push_back(signal_registry_t::label(v[i]));
        return csv::to_csv(cols, store.export_rows(cols));
    }
};

TEST_F(CsvImportTests, RoundTripThroughText) {
    store_t store;
    store.select_signals(signal_registry_t::default_active());
    store.add_control_point(SIG_HR, 30000, 80);
    store.add_control_point(SIG_HR, 90000, 100);
    store.add_control_point(SIG_ETCO2, 45000, 41.5);
    const std::string text = export_text(store);

    store_t other;
    std::string errmsg;
    ASSERT_TRUE(import_text(other, text, &errmsg)) << errmsg;

    EXPECT_DOUBLE_EQ(other.timeline().duration, 120);
    EXPECT_EQ(other.timeline().sr, 1000);
    EXPECT_EQ(other.timeline().visible(), signal_registry_t::default_active());
    EXPECT_EQ(export_text(other), text);
    EXPECT_EQ(other.undo_size(), 1);
}

TEST_F(CsvImportTests, MalformedFileLeavesTimelineAlone) {
    store_t store;
    store.select_signals({ SIG_HR });
    std::shared_ptr<const timeline_t> s0 = store.snapshot();

    std::string errmsg;
    EXPECT_FALSE(import_text(store, "foo,bar\n1,2\n", &errmsg));
    EXPECT_EQ(errmsg.find("no time column"), 0u);
    EXPECT_EQ(store.snapshot(), s0);

    EXPECT_FALSE(import_text(store, "Time,Foo\n0,1\n", &errmsg));
    EXPECT_NE(errmsg.find("no column matches a known signal"), std::string::npos);

    EXPECT_FALSE(import_text(store, "Time,HR\n", &errmsg));
    EXPECT_EQ(errmsg, "no data rows");

    EXPECT_FALSE(import_text(store, "Time,HR\nlater,80\n", &errmsg));
    EXPECT_EQ(errmsg, "no rows with a valid time value");

    EXPECT_FALSE(store.import_csv("/no/such/dir/vitals.csv", &errmsg));
    EXPECT_EQ(store.snapshot(), s0);
}

TEST_F(CsvImportTests, BadTimeRowsAreDropped) {
    store_t store;
    std::string errmsg;
    ASSERT_TRUE(import_text(store, "Time,HR\n0,80\nabc,90\n2000,100\n", &errmsg)) << errmsg;
    EXPECT_EQ(store.timeline().sr, 2000);
    EXPECT_DOUBLE_EQ(store.timeline().duration, 2);
    const std::vector<data_point_t> & d = store.timeline().signal(SIG_HR).data;
    ASSERT_EQ(d.size(), 2u);
    EXPECT_DOUBLE_EQ(d[0].value, 80);
    EXPECT_DOUBLE_EQ(d[1].value, 100);
}

TEST_F(CsvImportTests, MinutesSecondsTimes) {
    store_t store;
    std::string errmsg;
    ASSERT_TRUE(import_text(store, "Time,HR\n00:00,60\n00:05,65\n00:10,70\n", &errmsg)) << errmsg;
    EXPECT_EQ(store.timeline().sr, 5000);
    EXPECT_DOUBLE_EQ(store.timeline().duration, 10);
    const std::vector<data_point_t> & d = store.timeline().signal(SIG_HR).data;
    ASSERT_EQ(d.size(), 3u);
    EXPECT_DOUBLE_EQ(d[1].value, 65);
}

TEST_F(CsvImportTests, FastRatesAreFloored) {
    store_t store;
    std::string errmsg;
    ASSERT_TRUE(import_text(store,
                            "RelativeTimeMilliseconds,SpO2\n0,97\n250,96\n500,95\n750,94\n1000,93\n",
                            &errmsg)) << errmsg;
    EXPECT_EQ(store.timeline().sr, 1000);
    EXPECT_DOUBLE_EQ(store.timeline().duration, 1);
    const std::vector<data_point_t> & d = store.timeline().signal(SIG_SPO2).data;
    ASSERT_EQ(d.size(), 2u);
    EXPECT_DOUBLE_EQ(d[0].value, 97);
    EXPECT_DOUBLE_EQ(d[1].value, 93);
}

TEST_F(CsvImportTests, TimesAreRelativeToTheFirstRow) {
    store_t store;
    std::string errmsg;
    ASSERT_TRUE(import_text(store, "RelativeTimeMilliseconds,HR\n7000,100\n5000,80\n6000,90\n", &errmsg)) << errmsg;
    const std::vector<data_point_t> & d = store.timeline().signal(SIG_HR).data;
    ASSERT_EQ(d.size(), 3u);
    EXPECT_EQ(d[0].msec, 0u);
    EXPECT_DOUBLE_EQ(d[0].value, 80);
    EXPECT_DOUBLE_EQ(d[2].value, 100);
}

TEST_F(CsvImportTests, ValuesAreClamped) {
    store_t store;
    std::string errmsg;
    ASSERT_TRUE(import_text(store, "Time,SpO2\n0,120\n1000,20\n", &errmsg)) << errmsg;
    const std::vector<data_point_t> & d = store.timeline().signal(SIG_SPO2).data;
    EXPECT_DOUBLE_EQ(d[0].value, 100);
    EXPECT_DOUBLE_EQ(d[1].value, 50);
}

TEST_F(CsvImportTests, GapsAreInterpolated) {
    store_t store;
    std::string errmsg;
    ASSERT_TRUE(import_text(store, "Time,HR,SpO2\n0,80,97\n1000,,96\n2000,100,95\n3000,n/a,94\n", &errmsg)) << errmsg;
    const std::vector<data_point_t> & hr = store.timeline().signal(SIG_HR).data;
    EXPECT_DOUBLE_EQ(hr[1].value, 90);
    EXPECT_DOUBLE_EQ(hr[3].value, 100);
    EXPECT_DOUBLE_EQ(store.timeline().signal(SIG_SPO2).data[1].value, 96);
}

TEST_F(CsvImportTests, RepeatedTimeKeepsLaterRow) {
    store_t store;
    std::string errmsg;
    ASSERT_TRUE(import_text(store, "Time,HR\n0,80\n1000,90\n1000,100\n2000,110\n", &errmsg)) << errmsg;
    EXPECT_EQ(store.timeline().sr, 1000);
    EXPECT_DOUBLE_EQ(store.timeline().signal(SIG_HR).data[1].value, 100);
}

TEST_F(CsvImportTests, HeadersMatchWithoutCase) {
    store_t store;
    std::string errmsg;
    ASSERT_TRUE(import_text(store, "time,hr,SPO2,Perf\n0,80,97,1.2\n1000,81,96,1.3\n", &errmsg)) << errmsg;
    EXPECT_TRUE(store.timeline().has(SIG_HR));
    EXPECT_TRUE(store.timeline().has(SIG_SPO2));
    EXPECT_EQ(store.timeline().signals.size(), 2u);
}

TEST_F(CsvImportTests, OtherSignalsAreCarriedHidden) {
    store_t store;
    store.select_signals(signal_registry_t::default_active());
    store.add_control_point(SIG_RR, 5000, 20);
    store.add_control_point(SIG_RR, 60000, 10);
    store.set_zoom_preset(SIG_HR, ZOOM_30S);

    std::stringstream ss;
    ss << "Time,HR\n";
    for (int i = 0; i <= 10; i++)
        ss << i * 1000 << "," << 80 + i << "\n";

    std::string errmsg;
    ASSERT_TRUE(import_text(store, ss.str(), &errmsg)) << errmsg;

    const timeline_t & t = store.timeline();
    EXPECT_DOUBLE_EQ(t.duration, 10);
    EXPECT_EQ(t.selected, std::vector<signal_key_t>({ SIG_HR }));
    EXPECT_EQ(t.visible(), std::vector<signal_key_t>({ SIG_HR }));
    EXPECT_EQ(t.signal(SIG_HR).order, 1);
    EXPECT_TRUE(t.signal(SIG_HR).cps.empty());
    EXPECT_EQ(t.signal(SIG_HR).zoom.scale, ZOOM_FULL);
    EXPECT_DOUBLE_EQ(t.signal(SIG_HR).data[10].value, 90);

    ASSERT_TRUE(t.has(SIG_RR));
    EXPECT_FALSE(t.signal(SIG_RR).visible);
    EXPECT_EQ(t.signal(SIG_RR).cps.size(), 1u);
    EXPECT_EQ(t.signal(SIG_RR).data.size(), 11u);
    EXPECT_DOUBLE_EQ(t.signal(SIG_RR).data[5].value, 20);

    std::string msg;
    EXPECT_TRUE(t.check(&msg)) << msg;

    // one import, one undo step
    ASSERT_TRUE(store.undo());
    EXPECT_DOUBLE_EQ(store.timeline().duration, 120);
    EXPECT_TRUE(store.timeline().signal(SIG_RR).visible);
}

TEST_F(CsvImportTests, CompressedFileRoundTrip) {
    store_t store;
    store.select_signals({ SIG_HR, SIG_NBP_SYS });
    store.add_control_point(SIG_NBP_SYS, 60000, 140);

    const std::string file = ::testing::TempDir() + "vitaline_roundtrip.csv.gz";
    std::vector<std::string> cols = { "Time", "RelativeTimeMilliseconds", "Clock", "HR", "NBP (Sys)" };

    std::string errmsg;
    ASSERT_TRUE(store.export_csv(file, cols, &errmsg)) << errmsg;

    store_t other;
    ASSERT_TRUE(other.import_csv(file, &errmsg)) << errmsg;
    EXPECT_DOUBLE_EQ(other.timeline().signal(SIG_NBP_SYS).data[60].value, 140);
    EXPECT_EQ(csv::to_csv(cols, other.export_rows(cols)), csv::to_csv(cols, store.export_rows(cols)));

    std::remove(file.c_str());
}

TEST_F(CsvExportTests, PrecisionFollowsTheSignalNotTheColumnText) {
    store_t store;
    store.select_signals({ SIG_HR, SIG_SPO2, SIG_ETCO2 });
    std::vector<row_t> rows = store.export_rows({ "HR", "hr", "spo2", "ETCO2" });
    EXPECT_EQ(*rows[0][0], "70");
    EXPECT_EQ(*rows[0][1], "70");
    EXPECT_EQ(*rows[0][2], "98");
    EXPECT_EQ(*rows[0][3], "35.0");
}

TEST_F(CsvFieldTests, TimeColumnWithNonAsciiHeaders) {
    EXPECT_EQ(csv::time_column({ "Fr\xC3\xA9quence", "HR", "Zeit\xC3\xA4Time" }), 2);
    EXPECT_EQ(csv::time_column({ "\xC3\xA9\xC3\xA8", "HR" }), -1);
}

TEST_F(CsvImportTests, ImportedSamplesAreNotEdits) {
    store_t store;
    std::string errmsg;
    ASSERT_TRUE(import_text(store, "Time,HR\n0,100\n1000,110\n2000,120\n", &errmsg)) << errmsg;
    ASSERT_TRUE(store.cascade());

    const std::vector<data_point_t> & d = store.timeline().signal(SIG_HR).data;
    ASSERT_EQ(d.size(), 3u);
    for (size_t i = 0; i < d.size(); i++)
        EXPECT_FALSE(d[i].modified);

    // nothing edited, so a longer timeline gets a plain baseline tail
    ASSERT_TRUE(store.set_duration(10));
    const signal_def_t & hr = signal_registry_t::def(SIG_HR);
    const std::vector<data_point_t> & e = store.timeline().signal(SIG_HR).data;
    ASSERT_EQ(e.size(), 11u);
    EXPECT_DOUBLE_EQ(e[2].value, 120);
    for (size_t i = 3; i < e.size(); i++)
        EXPECT_DOUBLE_EQ(e[i].value, hr.dflt);
}

TEST_F(CsvImportTests, DefaultThirtyMinuteScenarioRoundTrip) {
    globals::default_duration = 1800;
    globals::default_sample_rate = 1000;

    store_t store;
    store.select_signals(signal_registry_t::default_active());
    store.add_control_point(SIG_HR, 300000, 95);
    store.add_control_point(SIG_SPO2, 900000, 91);
    store.add_control_point(SIG_RR, 1200000, 22);
    store.add_control_point(SIG_ETCO2, 1500000, 44.5);
    const std::string text = export_text(store);

    store_t other;
    std::string errmsg;
    ASSERT_TRUE(import_text(other, text, &errmsg)) << errmsg;

    EXPECT_DOUBLE_EQ(other.timeline().duration, 1800);
    EXPECT_EQ(other.timeline().sr, 1000);
    EXPECT_EQ(other.timeline().size(), 1801u);
    EXPECT_EQ(export_text(other), text);
}
