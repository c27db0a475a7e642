#pragma once

int cmd_analytics(int argc, char** argv);
