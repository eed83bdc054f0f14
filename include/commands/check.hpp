#pragma once

int cmd_check(int argc, char** argv);
