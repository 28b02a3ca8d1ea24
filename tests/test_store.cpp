
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

#include <cmath>

class StoreTests : public VitalineTest {
protected:
    void SetUp() override {
        VitalineTest::SetUp();
        globals::default_duration = 120;
        globals::default_sample_rate = 1000;
    }
};

TEST_F(StoreTests, StartsEmptyFromDefaults) {
    store_t store;
    EXPECT_DOUBLE_EQ(store.timeline().duration, 120);
    EXPECT_EQ(store.timeline().sr, 1000);
    EXPECT_TRUE(store.timeline().signals.empty());
    EXPECT_EQ(store.undo_size(), 0);
    EXPECT_FALSE(store.undo());
    EXPECT_FALSE(store.redo());
}

TEST_F(StoreTests, UndoRedo) {
    store_t store;
    store.select_signals(signal_registry_t::default_active());
    const timeline_t before = store.timeline();

    ASSERT_TRUE(store.add_control_point(SIG_HR, 60000, 90));
    const timeline_t after = store.timeline();
    EXPECT_EQ(store.undo_size(), 2);

    ASSERT_TRUE(store.undo());
    EXPECT_EQ(store.timeline(), before);
    EXPECT_EQ(store.redo_size(), 1);

    ASSERT_TRUE(store.redo());
    EXPECT_EQ(store.timeline(), after);
    EXPECT_EQ(store.redo_size(), 0);
}

TEST_F(StoreTests, NewEditClearsRedo) {
    store_t store;
    store.select_signals({ SIG_HR });
    store.add_control_point(SIG_HR, 10000, 80);
    store.undo();
    ASSERT_EQ(store.redo_size(), 1);
    store.add_control_point(SIG_HR, 20000, 100);
    EXPECT_EQ(store.redo_size(), 0);
    EXPECT_FALSE(store.redo());
}

TEST_F(StoreTests, HistoryIsBounded) {
    store_t store;
    store.set_history_depth(3);
    store.select_signals({ SIG_HR });
    for (int i = 0; i < 10; i++)
        store.add_control_point(SIG_HR, i * 1000, 60 + i);
    EXPECT_EQ(store.undo_size(), 3);
    int n = 0;
    while (store.undo()) ++n;
    EXPECT_EQ(n, 3);
    EXPECT_EQ(store.timeline().signal(SIG_HR).cps.size(), 7u);
}

TEST_F(StoreTests, UnchangedResultIsNotRecorded) {
    store_t store;
    store.select_signals({ SIG_HR });
    const int n = store.undo_size();
    store.initialize_signal(SIG_HR);
    store.select_signals({ SIG_HR });
    EXPECT_EQ(store.undo_size(), n);
}

TEST_F(StoreTests, ZoomIsNotRecorded) {
    store_t store;
    store.select_signals({ SIG_HR, SIG_SPO2 });
    const int n = store.undo_size();

    ASSERT_TRUE(store.set_zoom_preset(SIG_HR, ZOOM_30S));
    EXPECT_EQ(store.undo_size(), n);
    EXPECT_EQ(store.timeline().signal(SIG_HR).zoom.scale, ZOOM_30S);
    EXPECT_DOUBLE_EQ(store.timeline().signal(SIG_HR).zoom.start, 45);
    EXPECT_EQ(store.timeline().signal(SIG_SPO2).zoom.scale, ZOOM_FULL);

    store.set_zoom_sync(true);
    ASSERT_TRUE(store.set_zoom(SIG_SPO2, zoom_t::make(ZOOM_5S, 10, 120)));
    EXPECT_EQ(store.timeline().signal(SIG_HR).zoom.scale, ZOOM_5S);
}

TEST_F(StoreTests, RejectedEditsPublishNothing) {
    store_t store;
    store.select_signals({ SIG_HR });
    std::shared_ptr<const timeline_t> s0 = store.snapshot();

    EXPECT_FALSE(store.set_duration(0));
    EXPECT_FALSE(store.set_duration(-1));
    EXPECT_FALSE(store.set_sample_rate(0));
    EXPECT_FALSE(store.add_control_point(SIG_HR, 1000, std::nan("")));
    EXPECT_FALSE(store.add_control_point(SIG_RR, 1000, 20));
    EXPECT_FALSE(store.move_control_point(SIG_HR, 0, 1000, 20));
    EXPECT_FALSE(store.delete_control_point(SIG_HR, 3));
    EXPECT_FALSE(store.reset_signal(SIG_ETCO2));
    EXPECT_FALSE(store.toggle_visibility(SIG_NBP_DIA));
    EXPECT_FALSE(store.set_zoom_preset(SIG_SPO2, ZOOM_5S));

    EXPECT_EQ(store.snapshot(), s0);
}

TEST_F(StoreTests, SnapshotsSurviveLaterEdits) {
    store_t store;
    store.select_signals({ SIG_HR });
    std::shared_ptr<const timeline_t> s0 = store.snapshot();
    store.add_control_point(SIG_HR, 10000, 150);
    store.set_duration(300);
    EXPECT_DOUBLE_EQ(s0->duration, 120);
    EXPECT_TRUE(s0->signal(SIG_HR).cps.empty());
    EXPECT_DOUBLE_EQ(s0->signal(SIG_HR).data[10].value, 70);
}

TEST_F(StoreTests, CascadeOnDurationIncrease) {
    store_t store;
    store.select_signals({ SIG_HR });
    store.add_control_point(SIG_HR, 60000, 90);
    ASSERT_TRUE(store.set_duration(180));

    const std::vector<data_point_t> & d = store.timeline().signal(SIG_HR).data;
    ASSERT_EQ(d.size(), 181u);
    for (size_t i = 121; i <= 180; i++)
        EXPECT_DOUBLE_EQ(d[i].value, 90);

    store.undo();
    store.set_cascade(false);
    ASSERT_TRUE(store.set_duration(180));
    EXPECT_DOUBLE_EQ(store.timeline().signal(SIG_HR).data[150].value, 70);
}

TEST_F(StoreTests, DurationRoundTrip) {
    store_t store;
    store.select_signals({ SIG_HR, SIG_RR });
    store.add_control_point(SIG_HR, 30000, 110);
    store.add_control_point(SIG_RR, 100000, 8);
    const timeline_t t0 = store.timeline();

    store.set_duration(600);
    store.set_duration(120);
    EXPECT_EQ(store.timeline().signal(SIG_HR).data, t0.signal(SIG_HR).data);
    EXPECT_EQ(store.timeline().signal(SIG_RR).data, t0.signal(SIG_RR).data);
}

TEST_F(StoreTests, SampleRateRoundTrip) {
    store_t store;
    store.select_signals({ SIG_HR });
    store.add_control_point(SIG_HR, 30000, 110);
    const timeline_t t0 = store.timeline();

    ASSERT_TRUE(store.set_sample_rate(500));
    EXPECT_EQ(store.timeline().size(), 241u);
    ASSERT_TRUE(store.set_sample_rate(1000));
    EXPECT_EQ(store.timeline().signal(SIG_HR).data, t0.signal(SIG_HR).data);

    std::string errmsg;
    EXPECT_TRUE(store.timeline().check(&errmsg)) << errmsg;
}

TEST_F(StoreTests, SetSampleAndReset) {
    store_t store;
    store.select_signals({ SIG_SPO2 });
    ASSERT_TRUE(store.set_sample(SIG_SPO2, 10000, 85));
    EXPECT_DOUBLE_EQ(store.timeline().signal(SIG_SPO2).data[10].value, 85);
    ASSERT_TRUE(store.reset_signal(SIG_SPO2));
    EXPECT_DOUBLE_EQ(store.timeline().signal(SIG_SPO2).data[10].value, 98);
    EXPECT_FALSE(store.timeline().signal(SIG_SPO2).data[10].modified);
}

TEST_F(StoreTests, WarningsAreCachedForLibraryCallers) {
    store_t store;
    EXPECT_FALSE(store.add_control_point(SIG_HR, 1000, 80));
    const std::string buf = logger.print_buffer();
    EXPECT_NE(buf.find("HR has not been selected or initialized"), std::string::npos);
    EXPECT_EQ(logger.print_buffer(), "");
}
