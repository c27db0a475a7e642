#pragma once

// intern-match recommend: candidate-facing top-K (zero-capacity internships excluded)
int cmd_recommend(int argc, char** argv);

// intern-match report: unfiltered admin ranking (zero-capacity internships kept)
int cmd_report(int argc, char** argv);
