#pragma once
#include "rag.hpp"
#include <iosfwd>

void print_answer(std::ostream& out, const Answer& ans);
void print_page(std::ostream& out, const PageInspection& p);
void print_report(std::ostream& out, const ReindexReport& r);

// Interactive session: plain lines are questions answered with the running history.
// Commands: page <doc> <n> [<n> ...] [explain|translate], reindex, clear, exit.
// Per-line errors go to err and the session continues. Returns at exit or end of input.
int run_chat(DocQaService& svc, std::istream& in, std::ostream& out, std::ostream& err);
