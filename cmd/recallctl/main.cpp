#include <grpcpp/grpcpp.h>

#include <google/protobuf/util/time_util.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "recall/scheduler/v1_grpc.hpp"

using namespace recall::scheduler::v1;
using google::protobuf::util::TimeUtil;

static void Usage() {
  std::cout << "Usage:\n"
            << "  recallctl <addr> <user> schedule <content_id> <question|knowledge_point>\n"
            << "  recallctl <addr> <user> due [limit]\n"
            << "  recallctl <addr> <user> complete <record_id> <quality 0-5> [expected_version]\n"
            << "  recallctl <addr> <user> delete <record_id>\n"
            << "  recallctl <addr> <user> show <record_id>\n"
            << "  recallctl <addr> <user> stats\n"
            << "  recallctl <addr> <user> upcoming [days]\n"
            << "  recallctl <addr> <user> daily [YYYY-MM-DD]\n"
            << "  recallctl <addr> <user> weekly [YYYY-MM-DD]\n"
            << "  recallctl <addr> <user> reminders\n";
}

static std::optional<ContentType> ParseContentType(const std::string& value) {
  if (value == "question") {
    return CONTENT_TYPE_QUESTION;
  }
  if (value == "knowledge_point" || value == "kp") {
    return CONTENT_TYPE_KNOWLEDGE_POINT;
  }
  return std::nullopt;
}

static const char* ContentTypeName(ContentType type) {
  switch (type) {
    case CONTENT_TYPE_QUESTION:
      return "question";
    case CONTENT_TYPE_KNOWLEDGE_POINT:
      return "knowledge_point";
    default:
      return "unspecified";
  }
}

static const char* PriorityName(ReminderPriority priority) {
  switch (priority) {
    case REMINDER_PRIORITY_HIGH:
      return "high";
    case REMINDER_PRIORITY_NORMAL:
      return "normal";
    case REMINDER_PRIORITY_LOW:
      return "low";
    default:
      return "-";
  }
}

static void PrintRecord(const ReviewRecord& record) {
  std::cout << "id=" << record.id() << "\n"
            << "content=" << ContentTypeName(record.content_type()) << ":" << record.content_id() << "\n"
            << "review_count=" << record.review_count() << "\n"
            << "ease_factor=" << record.ease_factor() << "\n"
            << "interval_days=" << record.interval_days() << "\n"
            << "next_review=" << TimeUtil::ToString(record.next_review()) << "\n";
  if (record.has_last_reviewed()) {
    std::cout << "last_reviewed=" << TimeUtil::ToString(record.last_reviewed()) << "\n";
  }
  std::cout << "version=" << record.version() << "\n";
}

static void PrintDaily(const DailySummary& day) {
  std::cout << day.date() << " completed=" << day.reviews_completed() << " due=" << day.reviews_due()
            << " avg_quality=" << day.average_quality() << " new=" << day.new_items_learned()
            << " due_tomorrow=" << day.due_tomorrow() << " completion=" << day.completion_rate() << "%\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 4) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string user = argv[2];
  std::string cmd  = argv[3];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto review_stub = ReviewService::NewStub(channel);
  auto stats_stub  = StatsService::NewStub(channel);

  grpc::ClientContext ctx;

  try {
    // ------------------------------------------------------------

    if (cmd == "schedule") {
      if (argc < 6) {
        Usage();
        return 1;
      }

      auto type = ParseContentType(argv[5]);
      if (!type.has_value()) {
        std::cerr << "unsupported content type: " << argv[5] << "\n";
        return 1;
      }

      ScheduleItemRequest req;
      req.set_user_id(user);
      req.set_content_id(argv[4]);
      req.set_content_type(type.value());

      ScheduleItemResponse resp;

      auto status = review_stub->ScheduleItem(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << (resp.created() ? "scheduled\n" : "already scheduled\n");
      PrintRecord(resp.record());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "due") {
      ListDueRequest req;
      req.set_user_id(user);
      if (argc >= 5) req.set_limit(static_cast<uint32_t>(std::stoul(argv[4])));

      ListDueResponse resp;

      auto status = review_stub->ListDue(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& item : resp.items()) {
        std::cout << item.record().id() << " " << ContentTypeName(item.record().content_type()) << ":"
                  << item.record().content_id() << " overdue_days=" << item.days_overdue() << "\n";
      }
      std::cout << "due=" << resp.items_size() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "complete") {
      if (argc < 6) {
        Usage();
        return 1;
      }

      CompleteReviewRequest req;
      req.set_user_id(user);
      req.set_record_id(argv[4]);
      req.set_quality(std::stoi(argv[5]));
      if (argc >= 7) req.set_expected_version(std::stoull(argv[6]));

      CompleteReviewResponse resp;

      auto status = review_stub->CompleteReview(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << (resp.replayed() ? "already recorded\n" : "completed\n");
      PrintRecord(resp.record());
      for (const auto& achievement : resp.achievements()) {
        std::cout << "achievement: " << achievement.title() << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "delete") {
      if (argc < 5) {
        Usage();
        return 1;
      }

      DeleteRecordRequest req;
      req.set_user_id(user);
      req.set_record_id(argv[4]);

      DeleteRecordResponse resp;

      auto status = review_stub->DeleteRecord(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "deleted " << resp.record_id() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "show") {
      if (argc < 5) {
        Usage();
        return 1;
      }

      GetRecordRequest req;
      req.set_user_id(user);
      req.set_record_id(argv[4]);

      GetRecordResponse resp;

      auto status = review_stub->GetRecord(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintRecord(resp.record());
      if (resp.classification().status() == DUE_STATUS_DUE) {
        std::cout << "status=due days_overdue=" << resp.classification().days_overdue() << "\n";
      } else {
        std::cout << "status=upcoming days_until=" << resp.classification().days_until() << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "stats") {
      GetOverviewRequest req;
      req.set_user_id(user);

      StatisticsOverview resp;

      auto status = stats_stub->GetOverview(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "total_items=" << resp.total_items() << "\n"
                << "due_today=" << resp.due_today() << "\n"
                << "overdue=" << resp.overdue() << "\n"
                << "completed_today=" << resp.completed_today() << "\n"
                << "due_this_week=" << resp.due_this_week() << "\n"
                << "average_ease_factor=" << resp.average_ease_factor() << "\n"
                << "learning_streak=" << resp.learning_streak() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "upcoming") {
      GetUpcomingRequest req;
      req.set_user_id(user);
      if (argc >= 5) req.set_days(static_cast<uint32_t>(std::stoul(argv[4])));

      GetUpcomingResponse resp;

      auto status = stats_stub->GetUpcoming(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& day : resp.days()) {
        std::cout << day.date() << " " << day.records_size() << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "daily") {
      GetDailySummaryRequest req;
      req.set_user_id(user);
      if (argc >= 5) req.set_date(argv[4]);

      DailySummary resp;

      auto status = stats_stub->GetDailySummary(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintDaily(resp);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "weekly") {
      GetWeeklySummaryRequest req;
      req.set_user_id(user);
      if (argc >= 5) req.set_week_start(argv[4]);

      WeeklySummary resp;

      auto status = stats_stub->GetWeeklySummary(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& day : resp.days()) PrintDaily(day);
      std::cout << "week_start=" << resp.week_start() << " total=" << resp.total_completed()
                << " active_days=" << resp.days_active() << " avg_daily=" << resp.average_daily_reviews()
                << " avg_quality=" << resp.average_quality() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "reminders") {
      GetRemindersRequest req;
      req.set_user_id(user);

      GetRemindersResponse resp;

      auto status = stats_stub->GetReminders(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& reminder : resp.reminders()) {
        std::cout << "[" << PriorityName(reminder.priority()) << "] " << reminder.record().id() << " "
                  << reminder.message() << "\n";
      }
      return 0;
    }
  } catch (const std::exception& e) {
    // std::stoi / std::stoul on bad arguments
    std::cerr << "invalid argument: " << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
