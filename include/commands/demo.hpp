#pragma once

int cmd_demo(int argc, char** argv);
