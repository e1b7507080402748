#include "camera_client.hpp"
#include "fake_camera.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace shotlink;
using namespace shotlink::testing;

namespace {

class CameraClientTest : public ::testing::Test {
protected:
  void SetUp() override {
    cfg.camera_retry_backoff = std::chrono::milliseconds(1);
    cfg.camera_retry_limit = 3;
    cfg.camera_poll_interval = std::chrono::milliseconds(20);
  }

  void make(uint16_t vendor = 0x1234, bool interrupt = true) {
    cam = std::make_shared<FakeCamera>(io, vendor, interrupt);
  }

  CameraError attach() {
    client = std::make_shared<CameraClient>(io, cam, cfg);
    client->set_event_handler(
        [this](const CameraEvent &ev) { events.push_back(ev); });
    CameraError result = CameraError::fatal(0xFFFF);
    client->attach([&result](CameraError e) { result = e; });
    drain(io);
    return result;
  }

  struct ReadResult {
    bool done{false};
    CameraError err;
    std::vector<uint8_t> data;
  };

  std::shared_ptr<ReadResult> read(uint32_t handle, uint64_t offset,
                                   uint32_t length, uint64_t tag = 0) {
    auto r = std::make_shared<ReadResult>();
    client->read_object(handle, offset, length, tag,
                        [r](CameraError e, std::vector<uint8_t> &&d) {
                          r->done = true;
                          r->err = e;
                          r->data = std::move(d);
                        });
    return r;
  }

  size_t count_events(CameraEventKind kind) const {
    size_t n = 0;
    for (auto &e : events)
      if (e.kind == kind)
        n++;
    return n;
  }

  asio::io_context io;
  BridgeConfig cfg;
  std::shared_ptr<FakeCamera> cam;
  std::shared_ptr<CameraClient> client;
  std::vector<CameraEvent> events;
};

} // namespace

TEST_F(CameraClientTest, AttachLoadsCatalogWithoutFolders) {
  make();
  uint32_t a = cam->add_object(pattern(1000), "IMG_0001.JPG");
  uint32_t dir = cam->add_folder("DCIM");
  uint32_t b = cam->add_object(pattern(2000), "IMG_0002.JPG");

  EXPECT_FALSE(attach());
  EXPECT_TRUE(client->attached());
  EXPECT_TRUE(cam->session_open());
  auto cat = client->catalog();
  ASSERT_EQ(cat->size(), 2u);
  EXPECT_EQ(cat->at(a).filename, "IMG_0001.JPG");
  EXPECT_EQ(cat->at(b).size, 2000u);
  EXPECT_EQ(cat->count(dir), 0u);
  EXPECT_EQ(client->device_info().model, "PTP-1");
  EXPECT_STREQ(client->quirks().name, "generic");
  EXPECT_TRUE(events.empty());

  ASSERT_GE(cam->commands.size(), 4u);
  EXPECT_EQ(cam->commands[0].code, ptp::op::GetDeviceInfo);
  EXPECT_EQ(cam->commands[1].code, ptp::op::OpenSession);
  EXPECT_EQ(cam->commands[1].tid, 0u);
  EXPECT_EQ(cam->commands[2].code, ptp::op::GetStorageIDs);
  EXPECT_EQ(cam->commands[2].tid, 1u);
  EXPECT_EQ(cam->commands[3].code, ptp::op::GetObjectHandles);
  EXPECT_EQ(cam->count(ptp::op::GetObjectInfo), 3u);
}

TEST_F(CameraClientTest, SessionAlreadyOpenIsTolerated) {
  make();
  cam->fail[ptp::op::OpenSession] = ptp::rc::SessionAlreadyOpen;
  EXPECT_FALSE(attach());
  EXPECT_TRUE(client->attached());
}

TEST_F(CameraClientTest, AttachFailsOnFatalResponse) {
  make();
  cam->fail[ptp::op::GetStorageIDs] = ptp::rc::AccessDenied;
  auto err = attach();
  EXPECT_EQ(err.kind, CameraErrorKind::Fatal);
  EXPECT_EQ(err.code, ptp::rc::AccessDenied);
  EXPECT_FALSE(client->attached());
}

TEST_F(CameraClientTest, UnknownSizeIsFlagged) {
  make();
  uint32_t small = cam->add_object(pattern(10), "A.JPG");
  // Objects over 4 GiB report 0xFFFFFFFF in the 32-bit size field.
  uint32_t big = cam->add_object(pattern(10), "BIG.MOV");
  cam->set_size_unknown(big);
  ASSERT_FALSE(attach());
  EXPECT_TRUE(client->catalog()->at(small).size_known);
  EXPECT_FALSE(client->catalog()->at(big).size_known);
}

TEST_F(CameraClientTest, RangedReadUsesPartialObject) {
  make();
  auto object = pattern(5000);
  uint32_t h = cam->add_object(object, "A.JPG");
  ASSERT_FALSE(attach());
  EXPECT_TRUE(client->partial_reads());

  auto r = read(h, 1000, 700);
  drain(io);
  ASSERT_TRUE(r->done);
  EXPECT_FALSE(r->err);
  EXPECT_EQ(r->data, std::vector<uint8_t>(object.begin() + 1000,
                                          object.begin() + 1700));
  EXPECT_EQ(cam->count(ptp::op::GetPartialObject), 1u);
  EXPECT_EQ(cam->commands.back().params(),
            (std::vector<uint32_t>{h, 1000, 700}));

  auto end = read(h, 5000, 100);
  drain(io);
  EXPECT_TRUE(end->done);
  EXPECT_FALSE(end->err);
  EXPECT_TRUE(end->data.empty());
}

TEST_F(CameraClientTest, ResponsesSplitAcrossPacketsAreReassembled) {
  make();
  auto object = pattern(3000);
  uint32_t h = cam->add_object(object, "A.JPG");
  cam->packet_size = 64;
  ASSERT_FALSE(attach());
  auto r = read(h, 0, 3000);
  drain(io);
  ASSERT_TRUE(r->done);
  EXPECT_EQ(r->data, object);
}

TEST_F(CameraClientTest, WithoutPartialReadsWholeObjectIsFetchedOnce) {
  make();
  cam->set_operations({ptp::op::GetDeviceInfo, ptp::op::OpenSession,
                       ptp::op::GetStorageIDs, ptp::op::GetObjectHandles,
                       ptp::op::GetObjectInfo, ptp::op::GetObject});
  auto object = pattern(4000);
  uint32_t h = cam->add_object(object, "A.JPG");
  ASSERT_FALSE(attach());
  EXPECT_FALSE(client->partial_reads());

  auto r1 = read(h, 0, 1500);
  auto r2 = read(h, 1500, 1500);
  drain(io);
  auto r3 = read(h, 3000, 1500);
  drain(io);
  EXPECT_EQ(cam->count(ptp::op::GetObject), 1u);
  EXPECT_EQ(cam->count(ptp::op::GetPartialObject), 0u);
  EXPECT_EQ(r1->data, std::vector<uint8_t>(object.begin(), object.begin() + 1500));
  EXPECT_EQ(r2->data,
            std::vector<uint8_t>(object.begin() + 1500, object.begin() + 3000));
  EXPECT_EQ(r3->data, std::vector<uint8_t>(object.begin() + 3000, object.end()));

  client->release(h);
  auto r4 = read(h, 0, 10);
  drain(io);
  EXPECT_EQ(cam->count(ptp::op::GetObject), 2u);
  EXPECT_EQ(r4->data.size(), 10u);
}

TEST_F(CameraClientTest, QuirkDisablesPartialReadsForSony) {
  make(0x054C);
  uint32_t h = cam->add_object(pattern(800), "DSC.ARW");
  ASSERT_FALSE(attach());
  EXPECT_STREQ(client->quirks().name, "Sony");
  EXPECT_FALSE(client->partial_reads());
  auto r = read(h, 100, 100);
  drain(io);
  EXPECT_EQ(r->data.size(), 100u);
  EXPECT_EQ(cam->count(ptp::op::GetObject), 1u);
}

TEST_F(CameraClientTest, CancelledWholeObjectFetchIsNotCached) {
  make(0x054C);
  auto object = pattern(800);
  uint32_t h = cam->add_object(object, "DSC.ARW");
  ASSERT_FALSE(attach());
  auto r = read(h, 0, 100, 77);
  client->cancel(77);
  client->release(h);
  drain(io);
  EXPECT_TRUE(r->done);
  EXPECT_EQ(r->err.code, ptp::rc::TransactionCancelled);
  EXPECT_EQ(cam->count(ptp::op::GetObject), 1u);

  // Nothing was kept, so the next reader fetches the object again.
  auto again = read(h, 0, 100, 78);
  drain(io);
  EXPECT_EQ(again->data,
            std::vector<uint8_t>(object.begin(), object.begin() + 100));
  EXPECT_EQ(cam->count(ptp::op::GetObject), 2u);
}

TEST_F(CameraClientTest, ReaderJoinsWholeObjectFetchInFlight) {
  make(0x054C);
  uint32_t h = cam->add_object(pattern(800), "DSC.ARW");
  ASSERT_FALSE(attach());
  auto first = read(h, 0, 100, 77);
  client->cancel(77);
  auto second = read(h, 100, 100, 78);
  drain(io);
  EXPECT_EQ(first->err.code, ptp::rc::TransactionCancelled);
  EXPECT_EQ(second->data.size(), 100u);
  EXPECT_EQ(cam->count(ptp::op::GetObject), 1u);
}

TEST_F(CameraClientTest, QuirkSelects64BitPartialRead) {
  make(0x04DA);
  auto ops = cam->info.operations_supported;
  ops.push_back(ptp::op::GetPartialObject64);
  cam->set_operations(ops);
  auto object = pattern(2000);
  uint32_t h = cam->add_object(object, "P.RW2");
  ASSERT_FALSE(attach());
  auto r = read(h, 10, 20);
  drain(io);
  EXPECT_EQ(r->data, std::vector<uint8_t>(object.begin() + 10, object.begin() + 30));
  EXPECT_EQ(cam->count(ptp::op::GetPartialObject64), 1u);
  EXPECT_EQ(cam->commands.back().params(),
            (std::vector<uint32_t>{h, 10, 0, 20}));
}

TEST_F(CameraClientTest, ReadsAreClampedToQuirkChunk) {
  make(0x04CB);
  uint32_t h = cam->add_object(pattern(400 * 1024), "F.RAF");
  ASSERT_FALSE(attach());
  auto r = read(h, 0, 400 * 1024);
  drain(io);
  EXPECT_EQ(r->data.size(), 256u * 1024);
}

TEST_F(CameraClientTest, DeviceBusyIsRetried) {
  make();
  uint32_t h = cam->add_object(pattern(100), "A.JPG");
  ASSERT_FALSE(attach());
  cam->busy[ptp::op::GetPartialObject] = 2;
  auto r = read(h, 0, 50);
  run_for(io, std::chrono::milliseconds(50));
  ASSERT_TRUE(r->done);
  EXPECT_FALSE(r->err);
  EXPECT_EQ(r->data.size(), 50u);
  EXPECT_EQ(cam->count(ptp::op::GetPartialObject), 3u);
}

TEST_F(CameraClientTest, RetriesAreBounded) {
  make();
  uint32_t h = cam->add_object(pattern(100), "A.JPG");
  ASSERT_FALSE(attach());
  cam->busy[ptp::op::GetPartialObject] = 100;
  auto r = read(h, 0, 50);
  run_for(io, std::chrono::milliseconds(100));
  ASSERT_TRUE(r->done);
  EXPECT_EQ(r->err.kind, CameraErrorKind::Retryable);
  EXPECT_EQ(r->err.code, ptp::rc::DeviceBusy);
  EXPECT_EQ(cam->count(ptp::op::GetPartialObject), 4u);
}

TEST_F(CameraClientTest, UsbTimeoutIsRetriedWithFreshTransaction) {
  make();
  uint32_t h = cam->add_object(pattern(100), "A.JPG");
  ASSERT_FALSE(attach());
  cam->read_timeouts = 1;
  auto r = read(h, 0, 40);
  run_for(io, std::chrono::milliseconds(50));
  ASSERT_TRUE(r->done);
  EXPECT_FALSE(r->err);
  EXPECT_EQ(r->data.size(), 40u);
  ASSERT_EQ(cam->count(ptp::op::GetPartialObject), 2u);
  auto n = cam->commands.size();
  EXPECT_NE(cam->commands[n - 1].tid, cam->commands[n - 2].tid);
}

TEST_F(CameraClientTest, FatalResponseIsReportedWithCode) {
  make();
  uint32_t h = cam->add_object(pattern(100), "A.JPG");
  ASSERT_FALSE(attach());
  cam->fail[ptp::op::GetPartialObject] = ptp::rc::GeneralError;
  auto r = read(h, 0, 50);
  drain(io);
  ASSERT_TRUE(r->done);
  EXPECT_EQ(r->err.kind, CameraErrorKind::Fatal);
  EXPECT_EQ(r->err.code, ptp::rc::GeneralError);
  EXPECT_EQ(cam->count(ptp::op::GetPartialObject), 1u);
}

TEST_F(CameraClientTest, TransactionsRunOneAtATimeInOrder) {
  make();
  auto object = pattern(1000);
  uint32_t h = cam->add_object(object, "A.JPG");
  ASSERT_FALSE(attach());
  std::vector<int> order;
  for (int i = 0; i < 4; i++)
    client->read_object(h, (uint64_t)i * 100, 100, 0,
                        [&order, i](CameraError, std::vector<uint8_t> &&) {
                          order.push_back(i);
                        });
  drain(io);
  EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3}));
}

TEST_F(CameraClientTest, CancelResolvesQueuedRequestsWithTag) {
  make();
  uint32_t h = cam->add_object(pattern(1000), "A.JPG");
  ASSERT_FALSE(attach());
  size_t before = cam->count(ptp::op::GetPartialObject);
  auto first = read(h, 0, 100, 7);
  auto second = read(h, 100, 100, 9);
  auto third = read(h, 200, 100, 9);
  client->cancel(9);
  drain(io);
  EXPECT_FALSE(first->err);
  EXPECT_EQ(second->err.code, ptp::rc::TransactionCancelled);
  EXPECT_EQ(third->err.code, ptp::rc::TransactionCancelled);
  EXPECT_EQ(cam->count(ptp::op::GetPartialObject), before + 1);
}

TEST_F(CameraClientTest, DeleteRemovesFromCatalog) {
  make();
  uint32_t h = cam->add_object(pattern(10), "A.JPG");
  ASSERT_FALSE(attach());
  CameraError result = CameraError::fatal(0xFFFF);
  client->delete_object(h, 0, [&result](CameraError e) { result = e; });
  drain(io);
  EXPECT_FALSE(result);
  EXPECT_FALSE(cam->has_object(h));
  EXPECT_EQ(client->catalog()->count(h), 0u);

  client->delete_object(h, 0, [&result](CameraError e) { result = e; });
  drain(io);
  EXPECT_EQ(result.code, ptp::rc::InvalidObjectHandle);
}

TEST_F(CameraClientTest, CatalogSnapshotsAreImmutable) {
  make();
  cam->add_object(pattern(10), "A.JPG");
  ASSERT_FALSE(attach());
  auto before = client->catalog();
  cam->add_object(pattern(10), "B.JPG", true);
  drain(io);
  EXPECT_EQ(before->size(), 1u);
  EXPECT_EQ(client->catalog()->size(), 2u);
}

TEST_F(CameraClientTest, InterruptEventsUpdateCatalogBeforeNotifying) {
  make();
  ASSERT_FALSE(attach());
  std::vector<bool> in_catalog;
  client->set_event_handler([&](const CameraEvent &ev) {
    events.push_back(ev);
    in_catalog.push_back(client->catalog()->count(ev.id) != 0);
  });
  uint32_t h = cam->add_object(pattern(10), "NEW.JPG", true);
  drain(io);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].kind, CameraEventKind::ObjectAdded);
  EXPECT_EQ(events[0].id, h);
  EXPECT_TRUE(in_catalog[0]);

  cam->remove_object(h, true);
  drain(io);
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[1].kind, CameraEventKind::ObjectRemoved);
  EXPECT_FALSE(in_catalog[1]);
}

TEST_F(CameraClientTest, VendorEventsAreTranslated) {
  make(0x04B0);
  ASSERT_FALSE(attach());
  uint32_t h = cam->add_object(pattern(10), "DSC_0001.NEF");
  cam->raise_event(0xC101, h);
  cam->raise_event(0xC999, h);
  drain(io);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].kind, CameraEventKind::ObjectAdded);
}

TEST_F(CameraClientTest, StoreRemovalRemovesItsObjectsFirst) {
  make();
  cam->add_storage(0x00020001);
  uint32_t a = cam->add_object(pattern(10), "A.JPG", false, 0x00020001);
  cam->add_object(pattern(10), "B.JPG");
  ASSERT_FALSE(attach());
  ASSERT_EQ(client->catalog()->size(), 2u);
  cam->remove_storage(0x00020001, true);
  drain(io);
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].kind, CameraEventKind::ObjectRemoved);
  EXPECT_EQ(events[0].id, a);
  EXPECT_EQ(events[1].kind, CameraEventKind::StoreRemoved);
  EXPECT_EQ(client->catalog()->size(), 1u);
}

TEST_F(CameraClientTest, PollingDiffsTheCatalog) {
  make(0x1234, false);
  uint32_t a = cam->add_object(pattern(10), "A.JPG");
  ASSERT_FALSE(attach());
  uint32_t b = cam->add_object(pattern(10), "B.JPG");
  cam->remove_object(a, false);
  run_for(io, std::chrono::milliseconds(60));
  EXPECT_EQ(count_events(CameraEventKind::ObjectAdded), 1u);
  EXPECT_EQ(count_events(CameraEventKind::ObjectRemoved), 1u);
  EXPECT_EQ(client->catalog()->count(b), 1u);
  EXPECT_EQ(client->catalog()->count(a), 0u);
  client->detach();
  drain(io);
}

TEST_F(CameraClientTest, PollingQuirkIgnoresInterruptEndpoint) {
  make(0x04A9, true);
  ASSERT_FALSE(attach());
  cam->add_object(pattern(10), "IMG_0001.CR3");
  run_for(io, std::chrono::milliseconds(60));
  EXPECT_EQ(count_events(CameraEventKind::ObjectAdded), 1u);
  client->detach();
  drain(io);
}

TEST_F(CameraClientTest, UnplugFailsRequestsAndReportsGoneOnce) {
  make();
  uint32_t h = cam->add_object(pattern(100), "A.JPG");
  ASSERT_FALSE(attach());
  cam->unplug();
  auto r = read(h, 0, 10);
  drain(io);
  ASSERT_TRUE(r->done);
  EXPECT_EQ(r->err.kind, CameraErrorKind::DeviceGone);
  EXPECT_TRUE(client->gone());
  EXPECT_FALSE(client->attached());
  EXPECT_EQ(count_events(CameraEventKind::DeviceGone), 1u);

  auto later = read(h, 0, 10);
  drain(io);
  EXPECT_EQ(later->err.kind, CameraErrorKind::DeviceGone);
  EXPECT_EQ(count_events(CameraEventKind::DeviceGone), 1u);
}

TEST_F(CameraClientTest, DetachCancelsWithoutDeviceGone) {
  make();
  uint32_t h = cam->add_object(pattern(100), "A.JPG");
  ASSERT_FALSE(attach());
  auto r = read(h, 0, 10);
  client->detach();
  drain(io);
  ASSERT_TRUE(r->done);
  EXPECT_EQ(r->err.code, ptp::rc::TransactionCancelled);
  EXPECT_EQ(count_events(CameraEventKind::DeviceGone), 0u);
  EXPECT_GE(cam->cancels(), 1u);
}
