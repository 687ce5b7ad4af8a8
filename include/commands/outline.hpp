#pragma once

int cmd_outline(int argc, char** argv);
